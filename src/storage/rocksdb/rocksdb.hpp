/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/storage_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace ringstore::storage {

  /**
   * @brief Storage of one block in its own RocksDB database directory.
   *
   * Writes go to RocksDB immediately; `flush()` forces the memtable to disk.
   */
  class RocksDbStorage : public Storage, NonCopyable, NonMovable {
   public:
    /// @throws std::system_error if the database can not be opened
    RocksDbStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                   std::filesystem::path path);

    ~RocksDbStorage() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 64;
    static constexpr uint32_t kDefaultBlockSizeKiB = 32;

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<std::string> get(const ByteView &key) const override;

    outcome::result<std::optional<std::string>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              std::string &&value) override;

    outcome::result<bool> remove(const ByteView &key) override;

    std::unique_ptr<Cursor> cursor() override;

    outcome::result<void> erase() override;

    outcome::result<void> flush() override;

    size_t size() const override;

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    std::filesystem::path path_;
    std::unique_ptr<rocksdb::DB> db_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

}  // namespace ringstore::storage
