/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>
#include <rapidjson/document.h>

#include "codec/field_type.hpp"
#include "codec/field_value.hpp"

namespace ringstore::codec {

  struct KeyField {
    std::string name;
    FieldType type;
  };

  /**
   * @brief Layout of the records of one sequence.
   *
   * The key is the concatenation of the encoded key fields in schema order.
   * The value is the JSON array of payload fields without the outer brackets,
   * or an empty string when the schema carries no payload.
   */
  class RecordSchema {
   public:
    /// @throws CodecError::SCHEMA_MISMATCH if `key` is empty
    RecordSchema(std::vector<KeyField> key,
                 std::vector<std::string> payload = {});

    /// Schema of primary data sequences: a single unsigned `id` field
    static const RecordSchema &objectIds();

    const std::vector<KeyField> &key() const {
      return key_;
    }

    const std::vector<std::string> &payload() const {
      return payload_;
    }

    /**
     * Encodes a full or partial key.
     * @param fields leading key fields, at most as many as the schema has
     * @param open_last encode the last given field in the open form, used
     * for scan bounds only
     */
    outcome::result<qtils::ByteVec> encodeKey(const Fields &fields,
                                              bool open_last = false) const;

    /// Inverse of `encodeKey` for full keys; all bytes must be consumed
    outcome::result<Fields> decodeKey(qtils::ByteView key) const;

    /// Payload string built from the fields of a JSON object
    outcome::result<std::string> encodeValue(
        const rapidjson::Value &object) const;

    /// JSON object with payload fields restored from the payload string
    outcome::result<rapidjson::Document> decodeValue(
        std::string_view value) const;

   private:
    std::vector<KeyField> key_;
    std::vector<std::string> payload_;
  };

  /// Key field value taken from a JSON value
  outcome::result<FieldValue> fieldFromJson(const rapidjson::Value &json,
                                            const FieldType &type);

  /// JSON value of a decoded key field
  rapidjson::Value fieldToJson(const FieldValue &value,
                               rapidjson::Document::AllocatorType &allocator);

}  // namespace ringstore::codec
