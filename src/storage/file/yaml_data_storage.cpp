/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/file/yaml_data_storage.hpp"

#include <charconv>
#include <ostream>

#include "codec/record_schema.hpp"
#include "log/formatters/filepath.hpp"
#include "serde/json.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {

  namespace {
    template <typename T>
    bool parsesAs(std::string_view s, T &v) {
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
      return ec == std::errc{} and ptr == s.data() + s.size();
    }

    bool isBoolLiteral(std::string_view s, bool &v) {
      if (s == "true" or s == "True" or s == "TRUE") {
        v = true;
        return true;
      }
      if (s == "false" or s == "False" or s == "FALSE") {
        v = false;
        return true;
      }
      return false;
    }

    /// Whether a plain YAML scalar with this text would not read as a string
    bool needsQuotes(std::string_view s) {
      if (s.empty() or s == "~" or s == "null" or s == "Null"
          or s == "NULL") {
        return true;
      }
      bool b{};
      int64_t i{};
      double d{};
      return isBoolLiteral(s, b) or parsesAs(s, i) or parsesAs(s, d);
    }
  }  // namespace

  void yamlToJson(const YAML::Node &node,
                  rapidjson::Value &out,
                  rapidjson::Document::AllocatorType &allocator) {
    switch (node.Type()) {
      case YAML::NodeType::Undefined:
      case YAML::NodeType::Null:
        out.SetNull();
        return;
      case YAML::NodeType::Sequence:
        out.SetArray();
        for (const auto &item : node) {
          rapidjson::Value v;
          yamlToJson(item, v, allocator);
          out.PushBack(v, allocator);
        }
        return;
      case YAML::NodeType::Map:
        out.SetObject();
        for (const auto &item : node) {
          rapidjson::Value v;
          yamlToJson(item.second, v, allocator);
          out.AddMember(
              rapidjson::Value{item.first.Scalar().c_str(), allocator},
              v,
              allocator);
        }
        return;
      case YAML::NodeType::Scalar:
        break;
    }

    const auto &s = node.Scalar();
    // "!" is the tag of quoted scalars
    if (node.Tag() != "!") {
      bool b{};
      int64_t i{};
      uint64_t u{};
      double d{};
      if (isBoolLiteral(s, b)) {
        out.SetBool(b);
        return;
      }
      if (parsesAs(s, i)) {
        out.SetInt64(i);
        return;
      }
      if (parsesAs(s, u)) {
        out.SetUint64(u);
        return;
      }
      if (parsesAs(s, d)) {
        out.SetDouble(d);
        return;
      }
    }
    out.SetString(
        s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
  }

  void emitJson(YAML::Emitter &emitter, const rapidjson::Value &value) {
    if (value.IsNull()) {
      emitter << YAML::Null;
    } else if (value.IsBool()) {
      emitter << value.GetBool();
    } else if (value.IsInt64()) {
      emitter << value.GetInt64();
    } else if (value.IsUint64()) {
      emitter << value.GetUint64();
    } else if (value.IsNumber()) {
      emitter << value.GetDouble();
    } else if (value.IsString()) {
      std::string s{value.GetString(), value.GetStringLength()};
      if (needsQuotes(s)) {
        emitter << YAML::DoubleQuoted << s;
      } else {
        emitter << s;
      }
    } else if (value.IsArray()) {
      emitter << YAML::Flow << YAML::BeginSeq;
      for (auto &item : value.GetArray()) {
        emitJson(emitter, item);
      }
      emitter << YAML::EndSeq;
    } else {
      emitter << YAML::BeginMap;
      for (auto &member : value.GetObject()) {
        emitter << YAML::Key
                << std::string{member.name.GetString(),
                               member.name.GetStringLength()}
                << YAML::Value;
        emitJson(emitter, member.value);
      }
      emitter << YAML::EndMap;
    }
  }

  outcome::result<void> YamlDataStorage::put(const ByteView &key,
                                             std::string &&value) {
    auto data = json::parse(value);
    if (data.has_error()) {
      SL_ERROR(logger_, "Record {} has malformed JSON value", key.toHex());
      return StorageError::INVALID_ARGUMENT;
    }
    if (data.value().IsObject()) {
      for (auto field : {kIdField, kDataField}) {
        if (data.value().HasMember(rapidjson::Value{
                rapidjson::StringRef(field.data(), field.size())})) {
          SL_ERROR(logger_,
                   "Record {} has reserved field {}",
                   key.toHex(),
                   field);
          return StorageError::INVALID_ARGUMENT;
        }
      }
    }
    return FileStorage::put(key, std::move(value));
  }

  outcome::result<std::vector<StorageEntry>> YamlDataStorage::parse(
      std::istream &in) const {
    YAML::Node root;
    try {
      root = YAML::Load(in);
    } catch (const YAML::Exception &e) {
      SL_ERROR(logger_, "Malformed YAML in {}: {}", path(), e.what());
      return StorageError::INVALID_FORMAT;
    }

    std::vector<StorageEntry> entries;
    if (root.IsNull()) {
      return entries;
    }
    if (not root.IsSequence()) {
      SL_ERROR(logger_, "File {} must contain a list of records", path());
      return StorageError::INVALID_FORMAT;
    }

    const auto &schema = codec::RecordSchema::objectIds();
    for (const auto &item : root) {
      if (not item.IsMap()) {
        return StorageError::INVALID_FORMAT;
      }
      auto id_node = item[std::string{kIdField}];
      uint64_t id{};
      if (not id_node.IsScalar() or not parsesAs(id_node.Scalar(), id)) {
        SL_ERROR(logger_, "Record without valid {} in {}", kIdField, path());
        return StorageError::INVALID_FORMAT;
      }

      rapidjson::Document data;
      if (auto payload = item[std::string{kDataField}]; payload.IsDefined()) {
        yamlToJson(payload, data, data.GetAllocator());
      } else {
        data.SetObject();
        for (const auto &field : item) {
          if (field.first.Scalar() == kIdField) {
            continue;
          }
          rapidjson::Value v;
          yamlToJson(field.second, v, data.GetAllocator());
          data.AddMember(
              rapidjson::Value{field.first.Scalar().c_str(),
                               data.GetAllocator()},
              v,
              data.GetAllocator());
        }
      }

      OUTCOME_TRY(key, schema.encodeKey({codec::FieldValue{id}}));
      entries.emplace_back(std::move(key), json::stringify(data));
    }
    return entries;
  }

  outcome::result<void> YamlDataStorage::serialize(
      std::ostream &out, const std::vector<StorageEntry> &entries) const {
    const auto &schema = codec::RecordSchema::objectIds();

    YAML::Emitter emitter;
    emitter << YAML::BeginSeq;
    for (auto &[key, value] : entries) {
      OUTCOME_TRY(fields, schema.decodeKey(key));
      auto data_res = json::parse(value);
      if (data_res.has_error()) {
        SL_ERROR(logger_, "Record {} has malformed JSON value", key.toHex());
        return StorageError::CORRUPTION;
      }
      auto &data = data_res.value();

      emitter << YAML::BeginMap;
      emitter << YAML::Key << std::string{kIdField} << YAML::Value
              << std::get<uint64_t>(fields.front());
      if (data.IsObject()) {
        for (auto &member : data.GetObject()) {
          emitter << YAML::Key
                  << std::string{member.name.GetString(),
                                 member.name.GetStringLength()}
                  << YAML::Value;
          emitJson(emitter, member.value);
        }
      } else {
        emitter << YAML::Key << std::string{kDataField} << YAML::Value;
        emitJson(emitter, data);
      }
      emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;

    if (not emitter.good()) {
      SL_ERROR(logger_, "YAML emitter failed: {}", emitter.GetLastError());
      return StorageError::INVALID_FORMAT;
    }
    out << emitter.c_str() << '\n';
    return outcome::success();
  }

}  // namespace ringstore::storage
