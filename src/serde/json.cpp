/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/json.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

OUTCOME_CPP_DEFINE_CATEGORY(ringstore::json, JsonError, e) {
  using E = ringstore::json::JsonError;
  switch (e) {
    case E::PARSE_FAILED:
      return "malformed JSON text";
    case E::NOT_AN_OBJECT:
      return "JSON value is not an object";
  }
  return "unknown JsonError";
}

namespace ringstore::json {

  outcome::result<rapidjson::Document> parse(std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    if (document.HasParseError()) {
      return JsonError::PARSE_FAILED;
    }
    return document;
  }

  outcome::result<rapidjson::Document> parseObject(std::string_view json_str) {
    OUTCOME_TRY(document, parse(json_str));
    if (not document.IsObject()) {
      return JsonError::NOT_AN_OBJECT;
    }
    return document;
  }

  std::string stringify(Json json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.v.Accept(writer);
    return {buffer.GetString(), buffer.GetSize()};
  }

  rapidjson::Document clone(const rapidjson::Value &v) {
    rapidjson::Document document;
    document.CopyFrom(v, document.GetAllocator());
    return document;
  }

}  // namespace ringstore::json
