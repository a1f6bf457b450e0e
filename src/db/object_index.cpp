/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/object_index.hpp"

#include <qtils/error_throw.hpp>

#include "db/database_error.hpp"
#include "serde/json.hpp"

namespace ringstore::db {

  namespace {
    constexpr std::string_view kIdField = "id";
    constexpr std::string_view kCategoryField = "__category";

    std::shared_ptr<const codec::RecordSchema> makeSchema(
        const IndexConfig &config) {
      if (config.name.empty() or config.key.empty()) {
        qtils::raise(DatabaseError::INVALID_INDEX);
      }
      std::vector<codec::KeyField> key;
      for (size_t i = 0; i < config.key.size(); ++i) {
        const auto &field = config.key[i];
        if (field.plural and i != 0) {
          qtils::raise(DatabaseError::INVALID_INDEX);
        }
        key.push_back({.name = field.name, .type = field.type});
      }
      return std::make_shared<codec::RecordSchema>(std::move(key),
                                                   config.payload);
    }
  }  // namespace

  ObjectIndex::ObjectIndex(IndexConfig config)
      : config_{std::move(config)}, schema_{makeSchema(config_)} {}

  outcome::result<std::optional<codec::FieldValue>> ObjectIndex::fieldOf(
      const IndexConfig::Field &field,
      ObjectId id,
      const rapidjson::Value &object) const {
    if (field.name == kIdField) {
      return codec::FieldValue{id};
    }
    auto it = object.FindMember(field.name.c_str());
    if (it == object.MemberEnd() or it->value.IsNull()) {
      if (not field.type.nullable()) {
        return std::nullopt;
      }
      return codec::FieldValue{};
    }
    OUTCOME_TRY(value, codec::fieldFromJson(it->value, field.type));
    return value;
  }

  outcome::result<std::map<qtils::ByteVec, std::string>> ObjectIndex::records(
      ObjectId id, std::string_view data) const {
    std::map<qtils::ByteVec, std::string> records;

    OUTCOME_TRY(object, json::parse(data));
    if (not object.IsObject()) {
      return records;
    }
    if (config_.category.has_value()) {
      auto it = object.FindMember(kCategoryField.data());
      if (it == object.MemberEnd() or not it->value.IsString()
          or it->value.GetString() != *config_.category) {
        return records;
      }
    }

    codec::Fields tail;
    for (size_t i = 1; i < config_.key.size(); ++i) {
      OUTCOME_TRY(value, fieldOf(config_.key[i], id, object));
      if (not value.has_value()) {
        return records;
      }
      tail.emplace_back(std::move(value.value()));
    }
    OUTCOME_TRY(payload, schema_->encodeValue(object));

    auto add = [&](codec::FieldValue head) -> outcome::result<void> {
      codec::Fields fields;
      fields.reserve(config_.key.size());
      fields.emplace_back(std::move(head));
      fields.insert(fields.end(), tail.begin(), tail.end());
      OUTCOME_TRY(key, schema_->encodeKey(fields));
      records.emplace(std::move(key), payload);
      return outcome::success();
    };

    const auto &first = config_.key.front();
    if (not first.plural) {
      OUTCOME_TRY(head, fieldOf(first, id, object));
      if (head.has_value()) {
        OUTCOME_TRY(add(std::move(head.value())));
      }
      return records;
    }

    auto it = object.FindMember(first.name.c_str());
    if (it == object.MemberEnd() or not it->value.IsArray()) {
      return records;
    }
    for (const auto &element : it->value.GetArray()) {
      if (element.IsNull() and not first.type.nullable()) {
        continue;
      }
      OUTCOME_TRY(head, codec::fieldFromJson(element, first.type));
      OUTCOME_TRY(add(std::move(head)));
    }
    return records;
  }

  outcome::result<Index::ChangePlan> ObjectIndex::plan(
      ObjectId id,
      const std::optional<std::string> &prev,
      const std::optional<std::string> &next) const {
    std::map<qtils::ByteVec, std::string> old_records;
    std::map<qtils::ByteVec, std::string> new_records;
    if (prev.has_value()) {
      OUTCOME_TRY(derived, records(id, *prev));
      old_records = std::move(derived);
    }
    if (next.has_value()) {
      OUTCOME_TRY(derived, records(id, *next));
      new_records = std::move(derived);
    }

    ChangePlan plan;
    for (auto &[key, value] : old_records) {
      if (not new_records.contains(key)) {
        plan.deletes.push_back(key);
      }
    }
    for (auto &[key, value] : new_records) {
      auto it = old_records.find(key);
      if (it != old_records.end() and it->second == value) {
        continue;
      }
      plan.puts.emplace_back(key, std::move(value));
    }
    return plan;
  }

}  // namespace ringstore::db
