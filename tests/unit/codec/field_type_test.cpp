/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <limits>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "codec/codec_error.hpp"
#include "codec/field_type.hpp"

using qtils::ByteVec;
using qtils::ByteView;
using ringstore::codec::CodecError;
using ringstore::codec::FieldType;
using ringstore::codec::FieldValue;

namespace {
  ByteVec encode(const FieldType &type, const FieldValue &value) {
    ByteVec out;
    EXPECT_OUTCOME_SUCCESS(type.encode(out, value));
    return out;
  }

  /// Checks that encodings of `values` (given in ascending order) ascend too
  void expectOrdered(const FieldType &type,
                     const std::vector<FieldValue> &values) {
    for (size_t i = 1; i < values.size(); ++i) {
      auto lhs = encode(type, values[i - 1]);
      auto rhs = encode(type, values[i]);
      EXPECT_TRUE(std::ranges::lexicographical_compare(lhs, rhs))
          << ringstore::codec::toString(values[i - 1]) << " vs "
          << ringstore::codec::toString(values[i]);
    }
  }

  void expectRoundTrip(const FieldType &type,
                       const std::vector<FieldValue> &values) {
    for (const auto &value : values) {
      auto encoded = encode(type, value);
      ByteView in{encoded};
      ASSERT_OUTCOME_SUCCESS(decoded, type.decode(in));
      EXPECT_EQ(decoded, value) << ringstore::codec::toString(value);
      EXPECT_TRUE(in.empty());
    }
  }
}  // namespace

/**
 * @given adaptive unsigned type
 * @when encode values of growing magnitude
 * @then encodings are minimal, ascending and decodable
 */
TEST(FieldTypeTest, AdaptiveUint) {
  auto type = FieldType::unsignedInt();
  EXPECT_EQ(encode(type, FieldValue{uint64_t{0}}), (ByteVec{1, 0}));
  EXPECT_EQ(encode(type, FieldValue{uint64_t{0x1234}}),
            (ByteVec{2, 0x12, 0x34}));

  std::vector<FieldValue> values{uint64_t{0},
                                 uint64_t{1},
                                 uint64_t{255},
                                 uint64_t{256},
                                 uint64_t{65535},
                                 uint64_t{1} << 40,
                                 std::numeric_limits<uint64_t>::max()};
  expectOrdered(type, values);
  expectRoundTrip(type, values);
}

/**
 * @given nullable types of every kind
 * @when encode null and the smallest value
 * @then null sorts first
 */
TEST(FieldTypeTest, NullSortsFirst) {
  expectOrdered(FieldType::unsignedInt(0, true),
                {FieldValue{}, FieldValue{uint64_t{0}}});
  expectOrdered(FieldType::unsignedInt(2, true),
                {FieldValue{}, FieldValue{uint64_t{0}}});
  expectOrdered(FieldType::signedInt(2, true),
                {FieldValue{}, FieldValue{int64_t{-32768}}});
  expectOrdered(FieldType::string(true),
                {FieldValue{}, FieldValue{std::string{}}});
  expectOrdered(FieldType::boolean(true), {FieldValue{}, FieldValue{false}});

  expectRoundTrip(FieldType::unsignedInt(2, true), {FieldValue{}});
  expectRoundTrip(FieldType::string(true), {FieldValue{}});
}

/**
 * @given signed type of default width
 * @when encode negative, zero and positive values
 * @then byte order matches numeric order
 */
TEST(FieldTypeTest, SignedInt) {
  auto type = FieldType::signedInt();
  std::vector<FieldValue> values{int64_t{-(int64_t{1} << 47)},
                                 int64_t{-1000},
                                 int64_t{-1},
                                 int64_t{0},
                                 int64_t{1},
                                 int64_t{1000},
                                 int64_t{(int64_t{1} << 47) - 1}};
  expectOrdered(type, values);
  expectRoundTrip(type, values);

  ByteVec out;
  EXPECT_OUTCOME_ERROR(type.encode(out, FieldValue{int64_t{1} << 47}),
                       CodecError::INVALID_FIELD_VALUE);
}

/**
 * @given string type
 * @when encode strings sharing prefixes and containing zero bytes
 * @then byte order matches string order and zeros survive a round trip
 */
TEST(FieldTypeTest, String) {
  auto type = FieldType::string();
  using namespace std::string_literals;
  std::vector<FieldValue> values{""s, "a"s, "a\0"s, "a\0b"s, "ab"s, "b"s};
  expectOrdered(type, values);
  expectRoundTrip(type, values);
}

/**
 * @given string type
 * @when encode in the open form
 * @then no terminator is written and the open prefix sorts before its
 * extensions
 */
TEST(FieldTypeTest, OpenString) {
  auto type = FieldType::string();
  ByteVec open;
  ASSERT_OUTCOME_SUCCESS(type.encode(open, FieldValue{std::string{"ab"}}, true));
  EXPECT_EQ(open, (ByteVec{'a', 'b'}));
  EXPECT_TRUE(std::ranges::lexicographical_compare(
      open, encode(type, FieldValue{std::string{"ab"}})));
  EXPECT_TRUE(std::ranges::lexicographical_compare(
      open, encode(type, FieldValue{std::string{"abc"}})));
}

/**
 * @given field types
 * @when encode values of mismatching kind or null into non-nullable type
 * @then encoding fails with INVALID_FIELD_VALUE
 */
TEST(FieldTypeTest, RejectsWrongValues) {
  ByteVec out;
  EXPECT_OUTCOME_ERROR(FieldType::string().encode(out, FieldValue{true}),
                       CodecError::INVALID_FIELD_VALUE);
  EXPECT_OUTCOME_ERROR(FieldType::boolean().encode(out, FieldValue{}),
                       CodecError::INVALID_FIELD_VALUE);
  EXPECT_OUTCOME_ERROR(
      FieldType::unsignedInt(1).encode(out, FieldValue{uint64_t{256}}),
      CodecError::INVALID_FIELD_VALUE);
}

/**
 * @given type names of the configuration
 * @when resolve them
 * @then known names give types, unknown fail with SCHEMA_MISMATCH
 */
TEST(FieldTypeTest, FromName) {
  ASSERT_OUTCOME_SUCCESS(int_type, FieldType::fromName("int"));
  EXPECT_EQ(int_type.length(), FieldType::kDefaultIntLength);
  ASSERT_OUTCOME_SUCCESS(bool_type, FieldType::fromName("bool", 0, true));
  EXPECT_EQ(bool_type, FieldType::boolean(true));
  EXPECT_OUTCOME_ERROR(FieldType::fromName("float"),
                       CodecError::SCHEMA_MISMATCH);
}
