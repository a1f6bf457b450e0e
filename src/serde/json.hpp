/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <rapidjson/document.h>

namespace ringstore::json {

  enum class JsonError : uint8_t {
    PARSE_FAILED = 1,
    NOT_AN_OBJECT,
  };

  struct Json {
    const rapidjson::Value &v;
  };

  /// Parses JSON text into a standalone document
  outcome::result<rapidjson::Document> parse(std::string_view json_str);

  /// Same as `parse`, but requires the top-level value to be an object
  outcome::result<rapidjson::Document> parseObject(std::string_view json_str);

  /// Compact JSON text of the value
  std::string stringify(Json json);

  inline std::string stringify(const rapidjson::Value &v) {
    return stringify(Json{v});
  }

  /// Deep copy of `v` as a new document
  rapidjson::Document clone(const rapidjson::Value &v);

}  // namespace ringstore::json

OUTCOME_HPP_DECLARE_ERROR(ringstore::json, JsonError);
