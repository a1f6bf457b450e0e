/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "codec/field_value.hpp"

namespace ringstore::codec {

  /**
   * @brief Binary encoding of one key field.
   *
   * Every encoding is order preserving: byte-wise comparison of two encoded
   * values gives the same result as comparison of the values themselves.
   * Encodings are self-delimiting, except the open form of strings which is
   * only produced for the last field of a scan bound.
   */
  class FieldType {
   public:
    enum class Kind : uint8_t {
      UINT,
      INT,
      STRING,
      BOOLEAN,
    };

    static constexpr size_t kDefaultIntLength = 6;

    /**
     * Unsigned integer.
     * @param length 0 for the adaptive form (length byte followed by minimal
     * big-endian bytes), otherwise fixed width 1..8 bytes
     * @param nullable whether null is an allowed value
     */
    static FieldType unsignedInt(size_t length = 0, bool nullable = false);

    /// Signed integer of fixed width 1..8 bytes
    static FieldType signedInt(size_t length = kDefaultIntLength,
                               bool nullable = false);

    static FieldType string(bool nullable = false);

    static FieldType boolean(bool nullable = false);

    /**
     * Type by its configuration name: `uint`, `int`, `string`, `boolean`.
     * @param length width for integer types, 0 selects the default
     */
    static outcome::result<FieldType> fromName(std::string_view name,
                                               size_t length = 0,
                                               bool nullable = false);

    Kind kind() const {
      return kind_;
    }

    size_t length() const {
      return length_;
    }

    bool nullable() const {
      return nullable_;
    }

    /**
     * Appends encoded `value` to `out`.
     * @param open produce the unterminated form (strings only)
     */
    outcome::result<void> encode(qtils::ByteVec &out,
                                 const FieldValue &value,
                                 bool open = false) const;

    /**
     * Decodes one value from the front of `in` and advances `in` past it.
     */
    outcome::result<FieldValue> decode(qtils::ByteView &in) const;

    bool operator==(const FieldType &) const = default;

   private:
    FieldType(Kind kind, size_t length, bool nullable)
        : kind_{kind}, length_{length}, nullable_{nullable} {}

    outcome::result<void> encodeUint(qtils::ByteVec &out,
                                     const FieldValue &value) const;
    outcome::result<void> encodeInt(qtils::ByteVec &out,
                                    const FieldValue &value) const;
    outcome::result<void> encodeString(qtils::ByteVec &out,
                                       const FieldValue &value,
                                       bool open) const;
    outcome::result<void> encodeBoolean(qtils::ByteVec &out,
                                        const FieldValue &value) const;

    outcome::result<FieldValue> decodeUint(qtils::ByteView &in) const;
    outcome::result<FieldValue> decodeInt(qtils::ByteView &in) const;
    outcome::result<FieldValue> decodeString(qtils::ByteView &in) const;
    outcome::result<FieldValue> decodeBoolean(qtils::ByteView &in) const;

    Kind kind_;
    size_t length_;
    bool nullable_;
  };

}  // namespace ringstore::codec
