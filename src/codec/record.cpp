/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/record.hpp"

namespace ringstore::codec {

  Record::Record(std::shared_ptr<const RecordSchema> schema,
                 Fields fields,
                 std::string value)
      : schema_{std::move(schema)},
        fields_{std::move(fields)},
        value_{std::move(value)} {}

  Record::Record(std::shared_ptr<const RecordSchema> schema,
                 qtils::ByteVec key,
                 std::string value)
      : schema_{std::move(schema)},
        key_{std::move(key)},
        value_{std::move(value)} {}

  outcome::result<Fields> Record::fields() const {
    if (not fields_) {
      OUTCOME_TRY(fields, schema_->decodeKey(*key_));
      fields_ = std::move(fields);
    }
    return *fields_;
  }

  outcome::result<qtils::ByteVec> Record::binaryKey() const {
    if (not key_) {
      OUTCOME_TRY(key, schema_->encodeKey(*fields_));
      key_ = std::move(key);
    }
    return *key_;
  }

  outcome::result<rapidjson::Document> Record::payload() const {
    return schema_->decodeValue(value_);
  }

}  // namespace ringstore::codec
