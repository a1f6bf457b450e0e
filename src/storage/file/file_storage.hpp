/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace ringstore::storage {

  /**
   * @brief Storage backed by a single file.
   *
   * The whole file is loaded into memory by `open()` and rewritten on every
   * `flush()`. Suitable for development-scale data only.
   */
  class FileStorage : public InMemoryStorage {
   public:
    /// Decides whether a key loaded from the file may be kept
    using KeyValidator = std::function<bool(const ByteView &key)>;

    FileStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                std::filesystem::path path,
                KeyValidator validator);

    /**
     * Loads the file. A missing file gives an empty storage.
     * Fails with DUPLICATE_KEY or KEY_OUT_OF_RANGE on the first bad entry.
     */
    outcome::result<void> open();

    outcome::result<void> flush() override;

    const std::filesystem::path &path() const {
      return path_;
    }

   protected:
    virtual outcome::result<std::vector<StorageEntry>> parse(
        std::istream &in) const = 0;

    virtual outcome::result<void> serialize(
        std::ostream &out, const std::vector<StorageEntry> &entries) const = 0;

    log::Logger logger_;

   private:
    std::filesystem::path path_;
    KeyValidator validator_;
  };

}  // namespace ringstore::storage
