/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/edit.hpp"

#include "serde/json.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ringstore::db, EditError, e) {
  using E = ringstore::db::EditError;
  switch (e) {
    case E::INVALID_JSON:
      return "edit carries malformed JSON";
    case E::NOT_AN_OBJECT:
      return "field edit applied to data which is not an object";
    case E::UNKNOWN_EDIT:
      return "unknown kind of edit";
  }
  return "unknown EditError";
}

namespace ringstore::db {

  namespace {
    using Allocator = rapidjson::Document::AllocatorType;

    void mergePatchInto(rapidjson::Value &target,
                        const rapidjson::Value &patch,
                        Allocator &allocator) {
      if (not patch.IsObject()) {
        target.CopyFrom(patch, allocator);
        return;
      }
      if (not target.IsObject()) {
        target.SetObject();
      }
      for (auto &member : patch.GetObject()) {
        if (member.value.IsNull()) {
          target.RemoveMember(member.name);
          continue;
        }
        if (auto it = target.FindMember(member.name);
            it != target.MemberEnd()) {
          mergePatchInto(it->value, member.value, allocator);
        } else {
          rapidjson::Value value;
          mergePatchInto(value, member.value, allocator);
          target.AddMember(
              rapidjson::Value{member.name, allocator}, value, allocator);
        }
      }
    }

    outcome::result<rapidjson::Document> parseEditJson(std::string_view json) {
      auto res = json::parse(json);
      if (res.has_error()) {
        return EditError::INVALID_JSON;
      }
      return std::move(res.value());
    }
  }  // namespace

  Edit Edit::overwrite(std::string data) {
    return {Kind::OVERWRITE, {}, std::move(data)};
  }

  Edit Edit::mergePatch(std::string patch) {
    return {Kind::MERGE_PATCH, {}, std::move(patch)};
  }

  Edit Edit::set(std::string field, std::string value) {
    return {Kind::SET, std::move(field), std::move(value)};
  }

  Edit Edit::unset(std::string field) {
    return {Kind::UNSET, std::move(field), {}};
  }

  outcome::result<Edit> Edit::fromName(std::string_view name,
                                       std::string json,
                                       std::string field) {
    if (name == "overwrite") {
      return overwrite(std::move(json));
    }
    if (name == "merge") {
      return mergePatch(std::move(json));
    }
    if (name == "set" and not field.empty()) {
      return set(std::move(field), std::move(json));
    }
    if (name == "unset" and not field.empty()) {
      return unset(std::move(field));
    }
    return EditError::UNKNOWN_EDIT;
  }

  outcome::result<void> Edit::apply(rapidjson::Document &data) const {
    auto &allocator = data.GetAllocator();
    switch (kind_) {
      case Kind::OVERWRITE: {
        OUTCOME_TRY(value, parseEditJson(json_));
        data.CopyFrom(value, allocator);
        return outcome::success();
      }
      case Kind::MERGE_PATCH: {
        OUTCOME_TRY(patch, parseEditJson(json_));
        mergePatchInto(data, patch, allocator);
        return outcome::success();
      }
      case Kind::SET: {
        if (not data.IsObject()) {
          return EditError::NOT_AN_OBJECT;
        }
        OUTCOME_TRY(value, parseEditJson(json_));
        rapidjson::Value copy{value, allocator};
        if (auto it = data.FindMember(field_.c_str());
            it != data.MemberEnd()) {
          it->value = copy;
        } else {
          data.AddMember(
              rapidjson::Value{field_.c_str(), allocator}, copy, allocator);
        }
        return outcome::success();
      }
      case Kind::UNSET: {
        if (not data.IsObject()) {
          return EditError::NOT_AN_OBJECT;
        }
        data.RemoveMember(field_.c_str());
        return outcome::success();
      }
    }
    return EditError::UNKNOWN_EDIT;
  }

  outcome::result<std::string> applyEdits(std::string_view data,
                                          const std::vector<Edit> &edits) {
    auto document = json::parse(data);
    if (document.has_error()) {
      return EditError::INVALID_JSON;
    }
    for (auto &edit : edits) {
      OUTCOME_TRY(edit.apply(document.value()));
    }
    return json::stringify(document.value());
  }

}  // namespace ringstore::db
