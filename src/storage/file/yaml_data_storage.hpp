/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>
#include <yaml-cpp/yaml.h>

#include "storage/file/file_storage.hpp"

namespace ringstore::storage {

  /**
   * @brief Primary data records kept in a human-editable YAML file.
   *
   * The file is a list of records. Each record has an `__id` field with the
   * object id and either the object fields flattened next to it, or the
   * `__data` field when the value is not a JSON object:
   * @code
   * - __id: 1
   *   name: first
   * - __id: 2
   *   __data: [1, 2, 3]
   * @endcode
   * Keys of this storage are object ids encoded by the object id schema,
   * values are JSON texts. Objects with top-level `__id` or `__data` fields
   * can't be written in this layout and are refused.
   */
  class YamlDataStorage final : public FileStorage {
   public:
    using FileStorage::FileStorage;

    static constexpr std::string_view kIdField = "__id";
    static constexpr std::string_view kDataField = "__data";

    /// Fails with INVALID_ARGUMENT if `value` can't be kept in the file
    outcome::result<void> put(const ByteView &key,
                              std::string &&value) override;

   protected:
    outcome::result<std::vector<StorageEntry>> parse(
        std::istream &in) const override;

    outcome::result<void> serialize(
        std::ostream &out,
        const std::vector<StorageEntry> &entries) const override;
  };

  /// Converts a YAML node into a JSON value; quoted scalars stay strings
  void yamlToJson(const YAML::Node &node,
                  rapidjson::Value &out,
                  rapidjson::Document::AllocatorType &allocator);

  /// Emits a JSON value as YAML
  void emitJson(YAML::Emitter &emitter, const rapidjson::Value &value);

}  // namespace ringstore::storage
