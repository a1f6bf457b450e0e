/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "codec/record_schema.hpp"

namespace ringstore::codec {

  /**
   * @brief Immutable key-value record of a sequence.
   *
   * Holds either the decoded key fields or the binary key and converts to
   * the other representation on first access. The value is kept as the
   * serialized payload string.
   */
  class Record {
   public:
    Record(std::shared_ptr<const RecordSchema> schema,
           Fields fields,
           std::string value = {});

    Record(std::shared_ptr<const RecordSchema> schema,
           qtils::ByteVec key,
           std::string value = {});

    const RecordSchema &schema() const {
      return *schema_;
    }

    outcome::result<Fields> fields() const;

    outcome::result<qtils::ByteVec> binaryKey() const;

    const std::string &value() const {
      return value_;
    }

    /// Payload fields decoded as a JSON object
    outcome::result<rapidjson::Document> payload() const;

   private:
    std::shared_ptr<const RecordSchema> schema_;
    mutable std::optional<Fields> fields_;
    mutable std::optional<qtils::ByteVec> key_;
    std::string value_;
  };

}  // namespace ringstore::codec
