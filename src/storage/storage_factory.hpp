/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/file/file_storage.hpp"
#include "storage/storage_types.hpp"

namespace ringstore::storage {

  /// Where and how a block keeps its records
  struct StorageSpec {
    /// Format tag; resolved from the path extension when empty
    std::string format;
    /// File or directory; unused by the memory format
    std::filesystem::path path;
  };

  /**
   * @brief Registry of storage backends by format tag.
   *
   * Built-in formats are `memory`, `yaml`, `jl` and `rocksdb`. The returned
   * storage is already opened (file contents loaded).
   */
  class StorageFactory {
   public:
    struct Options {
      std::filesystem::path path;
      FileStorage::KeyValidator validator;
    };

    using Constructor = std::function<outcome::result<std::unique_ptr<Storage>>(
        const Options &)>;

    explicit StorageFactory(qtils::SharedRef<log::LoggingSystem> logsys);

    /// Adds or replaces the backend for `format`
    void registerFormat(std::string format, Constructor constructor);

    /// Format tag of a file by its extension, e.g. `data.yaml` gives `yaml`
    std::optional<std::string> formatOf(
        const std::filesystem::path &path) const;

    /**
     * Creates and opens a storage.
     * @param validator check for every key loaded from a file
     * @return UNKNOWN_FORMAT when no backend matches the spec
     */
    outcome::result<std::unique_ptr<Storage>> create(
        const StorageSpec &spec, FileStorage::KeyValidator validator = {}) const;

   private:
    log::Logger logger_;
    std::map<std::string, Constructor> constructors_;
    std::map<std::string, std::string> extensions_;
  };

}  // namespace ringstore::storage
