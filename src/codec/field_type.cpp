/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/field_type.hpp"

#include <limits>
#include <optional>

#include <boost/assert.hpp>

#include "codec/codec_error.hpp"

namespace ringstore::codec {

  namespace {
    constexpr uint8_t kNullMarker = 0x00;
    constexpr uint8_t kValueMarker = 0x01;
    constexpr uint8_t kEscape = 0x00;
    constexpr uint8_t kEscapedZero = 0x01;
    constexpr uint8_t kTerminator = 0x00;

    void advance(qtils::ByteView &in, size_t n) {
      in = qtils::ByteView{in.data() + n, in.size() - n};
    }

    std::optional<uint64_t> asUnsigned(const FieldValue &value) {
      if (auto v = std::get_if<uint64_t>(&value)) {
        return *v;
      }
      if (auto v = std::get_if<int64_t>(&value); v and *v >= 0) {
        return static_cast<uint64_t>(*v);
      }
      return std::nullopt;
    }

    std::optional<int64_t> asSigned(const FieldValue &value) {
      if (auto v = std::get_if<int64_t>(&value)) {
        return *v;
      }
      if (auto v = std::get_if<uint64_t>(&value);
          v and *v <= static_cast<uint64_t>(
                  std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(*v);
      }
      return std::nullopt;
    }

    void putBigEndian(qtils::ByteVec &out, uint64_t v, size_t length) {
      for (size_t i = length; i > 0; --i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * (i - 1))));
      }
    }

    outcome::result<uint64_t> takeBigEndian(qtils::ByteView &in,
                                            size_t length) {
      if (in.size() < length) {
        return CodecError::CORRUPT_KEY;
      }
      uint64_t v = 0;
      for (size_t i = 0; i < length; ++i) {
        v = (v << 8) | in[i];
      }
      advance(in, length);
      return v;
    }

    /// Reads the null marker of nullable types; true if the value is null
    outcome::result<bool> takeNullMarker(qtils::ByteView &in) {
      if (in.empty()) {
        return CodecError::CORRUPT_KEY;
      }
      auto marker = in[0];
      if (marker != kNullMarker and marker != kValueMarker) {
        return CodecError::CORRUPT_KEY;
      }
      advance(in, 1);
      return marker == kNullMarker;
    }
  }  // namespace

  FieldType FieldType::unsignedInt(size_t length, bool nullable) {
    BOOST_ASSERT(length <= 8);
    return {Kind::UINT, length, nullable};
  }

  FieldType FieldType::signedInt(size_t length, bool nullable) {
    BOOST_ASSERT(length >= 1 and length <= 8);
    return {Kind::INT, length, nullable};
  }

  FieldType FieldType::string(bool nullable) {
    return {Kind::STRING, 0, nullable};
  }

  FieldType FieldType::boolean(bool nullable) {
    return {Kind::BOOLEAN, 1, nullable};
  }

  outcome::result<FieldType> FieldType::fromName(std::string_view name,
                                                 size_t length,
                                                 bool nullable) {
    if (length > 8) {
      return CodecError::SCHEMA_MISMATCH;
    }
    if (name == "uint") {
      return unsignedInt(length, nullable);
    }
    if (name == "int") {
      return signedInt(length == 0 ? kDefaultIntLength : length, nullable);
    }
    if (name == "string") {
      return string(nullable);
    }
    if (name == "boolean" or name == "bool") {
      return boolean(nullable);
    }
    return CodecError::SCHEMA_MISMATCH;
  }

  outcome::result<void> FieldType::encode(qtils::ByteVec &out,
                                          const FieldValue &value,
                                          bool open) const {
    if (isNull(value) and not nullable_) {
      return CodecError::INVALID_FIELD_VALUE;
    }
    switch (kind_) {
      case Kind::UINT:
        return encodeUint(out, value);
      case Kind::INT:
        return encodeInt(out, value);
      case Kind::STRING:
        return encodeString(out, value, open);
      case Kind::BOOLEAN:
        return encodeBoolean(out, value);
    }
    return CodecError::INVALID_FIELD_VALUE;
  }

  outcome::result<FieldValue> FieldType::decode(qtils::ByteView &in) const {
    switch (kind_) {
      case Kind::UINT:
        return decodeUint(in);
      case Kind::INT:
        return decodeInt(in);
      case Kind::STRING:
        return decodeString(in);
      case Kind::BOOLEAN:
        return decodeBoolean(in);
    }
    return CodecError::CORRUPT_KEY;
  }

  outcome::result<void> FieldType::encodeUint(qtils::ByteVec &out,
                                              const FieldValue &value) const {
    if (length_ == 0) {
      // adaptive: length byte, then minimal big-endian bytes; 0 length = null
      if (isNull(value)) {
        out.push_back(0);
        return outcome::success();
      }
      auto v = asUnsigned(value);
      if (not v) {
        return CodecError::INVALID_FIELD_VALUE;
      }
      size_t n = 1;
      while (n < 8 and (*v >> (8 * n)) != 0) {
        ++n;
      }
      out.push_back(static_cast<uint8_t>(n));
      putBigEndian(out, *v, n);
      return outcome::success();
    }

    uint64_t encoded = 0;
    if (not isNull(value)) {
      auto v = asUnsigned(value);
      if (not v) {
        return CodecError::INVALID_FIELD_VALUE;
      }
      if (nullable_) {
        if (*v == std::numeric_limits<uint64_t>::max()) {
          return CodecError::INVALID_FIELD_VALUE;
        }
        encoded = *v + 1;
      } else {
        encoded = *v;
      }
    }
    if (length_ < 8 and (encoded >> (8 * length_)) != 0) {
      return CodecError::INVALID_FIELD_VALUE;
    }
    putBigEndian(out, encoded, length_);
    return outcome::success();
  }

  outcome::result<void> FieldType::encodeInt(qtils::ByteVec &out,
                                             const FieldValue &value) const {
    if (nullable_) {
      out.push_back(isNull(value) ? kNullMarker : kValueMarker);
      if (isNull(value)) {
        return outcome::success();
      }
    }
    auto v = asSigned(value);
    if (not v) {
      return CodecError::INVALID_FIELD_VALUE;
    }
    const auto bits = 8 * length_;
    if (bits < 64) {
      const int64_t limit = int64_t{1} << (bits - 1);
      if (*v < -limit or *v >= limit) {
        return CodecError::INVALID_FIELD_VALUE;
      }
    }
    // shift the range so that the most negative value maps to zero
    auto shifted = static_cast<uint64_t>(*v) + (uint64_t{1} << (bits - 1));
    putBigEndian(out, shifted, length_);
    return outcome::success();
  }

  outcome::result<void> FieldType::encodeString(qtils::ByteVec &out,
                                                const FieldValue &value,
                                                bool open) const {
    if (nullable_) {
      out.push_back(isNull(value) ? kNullMarker : kValueMarker);
      if (isNull(value)) {
        return outcome::success();
      }
    }
    auto s = std::get_if<std::string>(&value);
    if (not s) {
      return CodecError::INVALID_FIELD_VALUE;
    }
    for (auto c : *s) {
      auto byte = static_cast<uint8_t>(c);
      out.push_back(byte);
      if (byte == kEscape) {
        out.push_back(kEscapedZero);
      }
    }
    if (not open) {
      out.push_back(kTerminator);
      out.push_back(kTerminator);
    }
    return outcome::success();
  }

  outcome::result<void> FieldType::encodeBoolean(
      qtils::ByteVec &out, const FieldValue &value) const {
    if (isNull(value)) {
      out.push_back(0);
      return outcome::success();
    }
    auto b = std::get_if<bool>(&value);
    if (not b) {
      return CodecError::INVALID_FIELD_VALUE;
    }
    out.push_back(static_cast<uint8_t>((*b ? 1 : 0) + (nullable_ ? 1 : 0)));
    return outcome::success();
  }

  outcome::result<FieldValue> FieldType::decodeUint(qtils::ByteView &in) const {
    if (length_ == 0) {
      if (in.empty()) {
        return CodecError::CORRUPT_KEY;
      }
      size_t n = in[0];
      advance(in, 1);
      if (n == 0) {
        if (not nullable_) {
          return CodecError::CORRUPT_KEY;
        }
        return FieldValue{};
      }
      if (n > 8) {
        return CodecError::CORRUPT_KEY;
      }
      OUTCOME_TRY(v, takeBigEndian(in, n));
      return FieldValue{v};
    }

    OUTCOME_TRY(v, takeBigEndian(in, length_));
    if (nullable_) {
      if (v == 0) {
        return FieldValue{};
      }
      return FieldValue{v - 1};
    }
    return FieldValue{v};
  }

  outcome::result<FieldValue> FieldType::decodeInt(qtils::ByteView &in) const {
    if (nullable_) {
      OUTCOME_TRY(is_null, takeNullMarker(in));
      if (is_null) {
        return FieldValue{};
      }
    }
    OUTCOME_TRY(shifted, takeBigEndian(in, length_));
    const auto bits = 8 * length_;
    // wraps around for negative values, giving their two's complement
    auto v = shifted - (uint64_t{1} << (bits - 1));
    return FieldValue{static_cast<int64_t>(v)};
  }

  outcome::result<FieldValue> FieldType::decodeString(
      qtils::ByteView &in) const {
    if (nullable_) {
      OUTCOME_TRY(is_null, takeNullMarker(in));
      if (is_null) {
        return FieldValue{};
      }
    }
    std::string s;
    size_t i = 0;
    while (true) {
      if (i >= in.size()) {
        return CodecError::CORRUPT_KEY;
      }
      auto byte = in[i];
      if (byte != kEscape) {
        s.push_back(static_cast<char>(byte));
        ++i;
        continue;
      }
      if (i + 1 >= in.size()) {
        return CodecError::CORRUPT_KEY;
      }
      auto next = in[i + 1];
      i += 2;
      if (next == kTerminator) {
        break;
      }
      if (next != kEscapedZero) {
        return CodecError::CORRUPT_KEY;
      }
      s.push_back('\0');
    }
    advance(in, i);
    return FieldValue{std::move(s)};
  }

  outcome::result<FieldValue> FieldType::decodeBoolean(
      qtils::ByteView &in) const {
    if (in.empty()) {
      return CodecError::CORRUPT_KEY;
    }
    int byte = in[0];
    advance(in, 1);
    if (nullable_) {
      if (byte == 0) {
        return FieldValue{};
      }
      --byte;
    }
    if (byte > 1) {
      return CodecError::CORRUPT_KEY;
    }
    return FieldValue{byte == 1};
  }

}  // namespace ringstore::codec
