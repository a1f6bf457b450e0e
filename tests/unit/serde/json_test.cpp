/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "serde/json.hpp"

namespace json = ringstore::json;
using ringstore::json::JsonError;

/**
 * @given JSON text with whitespace and unicode escapes
 * @when parse and stringify it
 * @then compact text with the same content is produced
 */
TEST(JsonTest, ParseStringify) {
  ASSERT_OUTCOME_SUCCESS(document,
                         json::parse(R"( { "a" : [1, 2.5, null], "b":"\u0041" } )"));
  EXPECT_EQ(json::stringify(document), R"({"a":[1,2.5,null],"b":"A"})");
}

TEST(JsonTest, Errors) {
  EXPECT_OUTCOME_ERROR(json::parse("{"), JsonError::PARSE_FAILED);
  EXPECT_OUTCOME_ERROR(json::parse(""), JsonError::PARSE_FAILED);
  EXPECT_OUTCOME_ERROR(json::parseObject("[1]"), JsonError::NOT_AN_OBJECT);
}

/**
 * @given member of a parsed document
 * @when clone it and drop the source
 * @then the copy stays intact
 */
TEST(JsonTest, Clone) {
  rapidjson::Document copy;
  {
    ASSERT_OUTCOME_SUCCESS(document, json::parse(R"({"inner":{"x":"y"}})"));
    copy = json::clone(document["inner"]);
  }
  EXPECT_EQ(json::stringify(copy), R"({"x":"y"})");
}
