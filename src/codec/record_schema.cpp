/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/record_schema.hpp"

#include <fmt/format.h>
#include <qtils/error_throw.hpp>

#include "codec/codec_error.hpp"
#include "serde/json.hpp"

namespace ringstore::codec {

  RecordSchema::RecordSchema(std::vector<KeyField> key,
                             std::vector<std::string> payload)
      : key_{std::move(key)}, payload_{std::move(payload)} {
    if (key_.empty()) {
      qtils::raise(CodecError::SCHEMA_MISMATCH);
    }
  }

  const RecordSchema &RecordSchema::objectIds() {
    static const RecordSchema schema{{{"id", FieldType::unsignedInt()}}};
    return schema;
  }

  outcome::result<qtils::ByteVec> RecordSchema::encodeKey(
      const Fields &fields, bool open_last) const {
    if (fields.size() > key_.size()) {
      return CodecError::SCHEMA_MISMATCH;
    }
    qtils::ByteVec out;
    for (size_t i = 0; i < fields.size(); ++i) {
      auto open = open_last and i + 1 == fields.size();
      OUTCOME_TRY(key_[i].type.encode(out, fields[i], open));
    }
    return out;
  }

  outcome::result<Fields> RecordSchema::decodeKey(qtils::ByteView key) const {
    Fields fields;
    fields.reserve(key_.size());
    for (auto &field : key_) {
      OUTCOME_TRY(value, field.type.decode(key));
      fields.emplace_back(std::move(value));
    }
    if (not key.empty()) {
      return CodecError::CORRUPT_KEY;
    }
    return fields;
  }

  outcome::result<std::string> RecordSchema::encodeValue(
      const rapidjson::Value &object) const {
    if (payload_.empty()) {
      return std::string{};
    }
    if (not object.IsObject()) {
      return CodecError::INVALID_PAYLOAD;
    }
    rapidjson::Document array;
    array.SetArray();
    auto &allocator = array.GetAllocator();
    for (auto &name : payload_) {
      auto it = object.FindMember(name.c_str());
      if (it == object.MemberEnd()) {
        array.PushBack(rapidjson::Value{}, allocator);
      } else {
        array.PushBack(rapidjson::Value{it->value, allocator}, allocator);
      }
    }
    auto text = json::stringify(array);
    // strip the brackets of the array
    return text.substr(1, text.size() - 2);
  }

  outcome::result<rapidjson::Document> RecordSchema::decodeValue(
      std::string_view value) const {
    rapidjson::Document object;
    object.SetObject();
    if (payload_.empty()) {
      return object;
    }
    auto parsed = json::parse(fmt::format("[{}]", value));
    if (parsed.has_error()) {
      return CodecError::INVALID_PAYLOAD;
    }
    auto &array = parsed.value();
    if (array.Size() != payload_.size()) {
      return CodecError::INVALID_PAYLOAD;
    }
    auto &allocator = object.GetAllocator();
    for (rapidjson::SizeType i = 0; i < array.Size(); ++i) {
      object.AddMember(
          rapidjson::Value{payload_[i].c_str(), allocator},
          rapidjson::Value{array[i], allocator},
          allocator);
    }
    return object;
  }

  outcome::result<FieldValue> fieldFromJson(const rapidjson::Value &json,
                                            const FieldType &type) {
    if (json.IsNull()) {
      return FieldValue{};
    }
    switch (type.kind()) {
      case FieldType::Kind::UINT:
        if (json.IsUint64()) {
          return FieldValue{json.GetUint64()};
        }
        break;
      case FieldType::Kind::INT:
        if (json.IsInt64()) {
          return FieldValue{json.GetInt64()};
        }
        break;
      case FieldType::Kind::STRING:
        if (json.IsString()) {
          return FieldValue{
              std::string{json.GetString(), json.GetStringLength()}};
        }
        break;
      case FieldType::Kind::BOOLEAN:
        if (json.IsBool()) {
          return FieldValue{json.GetBool()};
        }
        break;
    }
    return CodecError::INVALID_FIELD_VALUE;
  }

  rapidjson::Value fieldToJson(const FieldValue &value,
                               rapidjson::Document::AllocatorType &allocator) {
    return std::visit(
        [&](const auto &v) -> rapidjson::Value {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::monostate>) {
            return rapidjson::Value{};
          } else if constexpr (std::is_same_v<T, std::string>) {
            return rapidjson::Value{
                v.c_str(), static_cast<rapidjson::SizeType>(v.size()), allocator};
          } else {
            return rapidjson::Value{v};
          }
        },
        value);
  }

}  // namespace ringstore::codec
