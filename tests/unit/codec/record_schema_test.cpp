/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "codec/codec_error.hpp"
#include "codec/record.hpp"
#include "codec/record_schema.hpp"
#include "serde/json.hpp"

using qtils::ByteVec;
using namespace ringstore::codec;
namespace json = ringstore::json;

class RecordSchemaTest : public testing::Test {
 public:
  std::shared_ptr<const RecordSchema> schema =
      std::make_shared<RecordSchema>(
          std::vector<KeyField>{
              {"name", FieldType::string()},
              {"id", FieldType::unsignedInt()},
          },
          std::vector<std::string>{"age", "tags"});
};

/**
 * @given schema of two key fields
 * @when encode a full key and decode it back
 * @then the same fields are restored
 */
TEST_F(RecordSchemaTest, KeyRoundTrip) {
  Fields fields{std::string{"alice"}, uint64_t{42}};
  ASSERT_OUTCOME_SUCCESS(key, schema->encodeKey(fields));
  ASSERT_OUTCOME_SUCCESS(decoded, schema->decodeKey(key));
  EXPECT_EQ(decoded, fields);
}

/**
 * @given schema of two key fields
 * @when encode more fields than the schema has
 * @then SCHEMA_MISMATCH is returned
 */
TEST_F(RecordSchemaTest, TooManyFields) {
  EXPECT_OUTCOME_ERROR(
      schema->encodeKey({std::string{"a"}, uint64_t{1}, uint64_t{2}}),
      CodecError::SCHEMA_MISMATCH);
}

/**
 * @given valid encoded key
 * @when decode it with trailing bytes appended or with bytes cut off
 * @then CORRUPT_KEY is returned
 */
TEST_F(RecordSchemaTest, CorruptKey) {
  ASSERT_OUTCOME_SUCCESS(key,
                         schema->encodeKey({std::string{"a"}, uint64_t{1}}));
  auto longer = key;
  longer.push_back(0);
  EXPECT_OUTCOME_ERROR(schema->decodeKey(longer), CodecError::CORRUPT_KEY);
  ByteVec shorter(key.begin(), key.end() - 1);
  EXPECT_OUTCOME_ERROR(schema->decodeKey(shorter), CodecError::CORRUPT_KEY);
}

/**
 * @given partial key in the open form
 * @when compare it with full keys sharing the prefix
 * @then the bound sorts before all of them and after smaller names
 */
TEST_F(RecordSchemaTest, OpenBound) {
  ASSERT_OUTCOME_SUCCESS(bound, schema->encodeKey({std::string{"al"}}, true));
  ASSERT_OUTCOME_SUCCESS(alice,
                         schema->encodeKey({std::string{"alice"}, uint64_t{0}}));
  ASSERT_OUTCOME_SUCCESS(al, schema->encodeKey({std::string{"al"}, uint64_t{0}}));
  ASSERT_OUTCOME_SUCCESS(ak,
                         schema->encodeKey({std::string{"akz"}, uint64_t{9}}));
  EXPECT_LT(bound, al);
  EXPECT_LT(bound, alice);
  EXPECT_LT(ak, bound);
}

/**
 * @given schema with payload fields
 * @when encode an object missing one payload field
 * @then the value lists payload in order with null for the missing one
 * and decodes back into an object
 */
TEST_F(RecordSchemaTest, Payload) {
  ASSERT_OUTCOME_SUCCESS(object,
                         json::parse(R"({"name":"bob","age":30,"x":1})"));
  ASSERT_OUTCOME_SUCCESS(value, schema->encodeValue(object));
  EXPECT_EQ(value, "30,null");

  ASSERT_OUTCOME_SUCCESS(decoded, schema->decodeValue(value));
  EXPECT_EQ(json::stringify(decoded), R"({"age":30,"tags":null})");

  EXPECT_OUTCOME_ERROR(schema->decodeValue("1,2,3"),
                       CodecError::INVALID_PAYLOAD);
}

/**
 * @given schema without payload
 * @when encode any object
 * @then the value is empty
 */
TEST_F(RecordSchemaTest, NoPayload) {
  ASSERT_OUTCOME_SUCCESS(object, json::parse(R"({"a":1})"));
  ASSERT_OUTCOME_SUCCESS(value, RecordSchema::objectIds().encodeValue(object));
  EXPECT_EQ(value, "");
}

/**
 * @given empty key definition
 * @when construct a schema
 * @then SCHEMA_MISMATCH is thrown
 */
TEST(RecordSchemaCtorTest, EmptyKey) {
  EXPECT_THROW_OUTCOME(RecordSchema(std::vector<KeyField>{}), CodecError::SCHEMA_MISMATCH);
}

/**
 * @given record built from a binary key
 * @when access its fields and key
 * @then fields are decoded lazily and the key is kept as given
 */
TEST_F(RecordSchemaTest, RecordFromKey) {
  ASSERT_OUTCOME_SUCCESS(key,
                         schema->encodeKey({std::string{"c"}, uint64_t{7}}));
  Record record{schema, key, "1,[]"};
  ASSERT_OUTCOME_SUCCESS(fields, record.fields());
  EXPECT_EQ(fields, (Fields{std::string{"c"}, uint64_t{7}}));
  ASSERT_OUTCOME_SUCCESS(binary, record.binaryKey());
  EXPECT_EQ(binary, key);
  ASSERT_OUTCOME_SUCCESS(payload, record.payload());
  EXPECT_EQ(payload["age"].GetInt(), 1);
}

/**
 * @given record built from fields
 * @when request its binary key
 * @then the key equals the schema encoding of the fields
 */
TEST_F(RecordSchemaTest, RecordFromFields) {
  Fields fields{std::string{"d"}, uint64_t{8}};
  Record record{schema, fields};
  ASSERT_OUTCOME_SUCCESS(expected, schema->encodeKey(fields));
  ASSERT_OUTCOME_SUCCESS(binary, record.binaryKey());
  EXPECT_EQ(binary, expected);
}
