/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "db/database_error.hpp"
#include "db/object_index.hpp"

using ringstore::codec::Fields;
using ringstore::codec::FieldType;
using ringstore::db::DatabaseError;
using ringstore::db::IndexConfig;
using ringstore::db::ObjectIndex;

namespace {
  IndexConfig byName() {
    return {
        .name = "by_name",
        .key = {{.name = "name", .type = FieldType::string()},
                {.name = "id", .type = FieldType::unsignedInt()}},
        .payload = {"age"},
    };
  }

  Fields keyFields(const ObjectIndex &index, const qtils::ByteVec &key) {
    auto fields = index.schema()->decodeKey(key);
    EXPECT_TRUE(fields.has_value());
    return fields.value();
  }
}  // namespace

/**
 * @given index by name and id with age payload
 * @when derive records of an object
 * @then one record holds the name, the object id and the age
 */
TEST(ObjectIndexTest, Records) {
  ObjectIndex index{byName()};
  ASSERT_OUTCOME_SUCCESS(records,
                         index.records(5, R"({"name":"ann","age":31})"));
  ASSERT_EQ(records.size(), 1);
  auto &[key, value] = *records.begin();
  EXPECT_EQ(keyFields(index, key), (Fields{std::string{"ann"}, uint64_t{5}}));
  EXPECT_EQ(value, "31");
}

/**
 * @given index over a non-nullable field
 * @when the object lacks the field or has null
 * @then no records are derived
 */
TEST(ObjectIndexTest, MissingField) {
  ObjectIndex index{byName()};
  ASSERT_OUTCOME_SUCCESS(missing, index.records(1, R"({"age":1})"));
  EXPECT_TRUE(missing.empty());
  ASSERT_OUTCOME_SUCCESS(null, index.records(1, R"({"name":null})"));
  EXPECT_TRUE(null.empty());

  auto config = byName();
  config.key[0].type = FieldType::string(true);
  ObjectIndex nullable{config};
  ASSERT_OUTCOME_SUCCESS(records, nullable.records(1, R"({"age":1})"));
  EXPECT_EQ(records.size(), 1);
}

/**
 * @given index with a plural first field
 * @when derive records of an object with an array of tags
 * @then one record is made per tag
 */
TEST(ObjectIndexTest, PluralField) {
  ObjectIndex index{{
      .name = "by_tag",
      .key = {{.name = "tags", .type = FieldType::string(), .plural = true},
              {.name = "id", .type = FieldType::unsignedInt()}},
  }};
  ASSERT_OUTCOME_SUCCESS(records,
                         index.records(2, R"({"tags":["b","a","b"]})"));
  ASSERT_EQ(records.size(), 2);
  EXPECT_EQ(keyFields(index, records.begin()->first),
            (Fields{std::string{"a"}, uint64_t{2}}));
  EXPECT_EQ(records.begin()->second, "");
}

/**
 * @given index restricted to a category
 * @when derive records of objects of other and matching categories
 * @then only the matching object is indexed
 */
TEST(ObjectIndexTest, Category) {
  auto config = byName();
  config.category = "person";
  ObjectIndex index{config};
  ASSERT_OUTCOME_SUCCESS(other,
                         index.records(1, R"({"__category":"pet","name":"x"})"));
  EXPECT_TRUE(other.empty());
  ASSERT_OUTCOME_SUCCESS(
      person, index.records(1, R"({"__category":"person","name":"x"})"));
  EXPECT_EQ(person.size(), 1);
}

/**
 * @given object renamed and its age changed
 * @when plan the index change
 * @then the old key is deleted and the new one is put
 */
TEST(ObjectIndexTest, PlanRename) {
  ObjectIndex index{byName()};
  ASSERT_OUTCOME_SUCCESS(
      plan,
      index.plan(3, R"({"name":"a","age":1})", R"({"name":"b","age":1})"));
  ASSERT_EQ(plan.deletes.size(), 1);
  ASSERT_EQ(plan.puts.size(), 1);
  EXPECT_EQ(keyFields(index, plan.deletes[0]),
            (Fields{std::string{"a"}, uint64_t{3}}));
  EXPECT_EQ(keyFields(index, plan.puts[0].first),
            (Fields{std::string{"b"}, uint64_t{3}}));
}

/**
 * @given object whose indexed fields did not change
 * @when plan the index change
 * @then the plan is empty
 */
TEST(ObjectIndexTest, PlanUnchanged) {
  ObjectIndex index{byName()};
  ASSERT_OUTCOME_SUCCESS(
      plan,
      index.plan(3, R"({"name":"a","age":1,"x":1})", R"({"name":"a","age":1})"));
  EXPECT_TRUE(plan.empty());

  ASSERT_OUTCOME_SUCCESS(removal,
                         index.plan(3, R"({"name":"a"})", std::nullopt));
  EXPECT_EQ(removal.deletes.size(), 1);
  EXPECT_TRUE(removal.puts.empty());
}

/**
 * @given malformed index definitions
 * @when construct indexes
 * @then INVALID_INDEX is thrown
 */
TEST(ObjectIndexTest, InvalidDefinition) {
  EXPECT_THROW_OUTCOME(ObjectIndex(IndexConfig{.name = "empty"}),
                       DatabaseError::INVALID_INDEX);
  auto config = byName();
  config.key[1].plural = true;
  EXPECT_THROW_OUTCOME(ObjectIndex{config}, DatabaseError::INVALID_INDEX);
}
