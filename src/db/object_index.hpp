/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "db/index.hpp"

namespace ringstore::db {

  /// Definition of an index over object fields
  struct IndexConfig {
    struct Field {
      /// object field; `id` stands for the object id
      std::string name;
      codec::FieldType type;
      /// the field holds an array, one record is made per element
      bool plural = false;
    };

    std::string name;
    /// only objects with this `__category` are indexed
    std::optional<std::string> category;
    std::vector<Field> key;
    std::vector<std::string> payload;
  };

  /**
   * @brief Index whose keys and payload are taken from object fields.
   *
   * Only the first key field may be plural. Objects missing a non-nullable
   * key field produce no records.
   */
  class ObjectIndex final : public Index {
   public:
    /// @throws DatabaseError::INVALID_INDEX on a malformed definition
    explicit ObjectIndex(IndexConfig config);

    const std::string &name() const override {
      return config_.name;
    }

    std::shared_ptr<const codec::RecordSchema> schema() const override {
      return schema_;
    }

    const IndexConfig &config() const {
      return config_;
    }

    /// Index records of one object version, keyed by binary key
    outcome::result<std::map<qtils::ByteVec, std::string>> records(
        ObjectId id, std::string_view data) const;

    outcome::result<ChangePlan> plan(
        ObjectId id,
        const std::optional<std::string> &prev,
        const std::optional<std::string> &next) const override;

   private:
    outcome::result<std::optional<codec::FieldValue>> fieldOf(
        const IndexConfig::Field &field,
        ObjectId id,
        const rapidjson::Value &object) const;

    IndexConfig config_;
    std::shared_ptr<const codec::RecordSchema> schema_;
  };

}  // namespace ringstore::db
