/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/write_batch.h>
#include <soralog/macro.hpp>

#include "log/formatters/filepath.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {
  namespace fs = std::filesystem;

  RocksDbStorage::RocksDbStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                                 fs::path path)
      : path_{std::move(path)},
        logger_(logsys->getLogger("RocksDB", log::group::storage)) {
    ro_.fill_cache = false;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.optimize_filters_for_hits = true;
    options.table_factory.reset(
        rocksdb::NewBlockBasedTableFactory(tableOptionsConfiguration()));

    if (auto res = createDirectory(path_, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path_,
                  res.error());
      qtils::raise(res.error());
    }

    rocksdb::DB *db = nullptr;
    auto status = rocksdb::DB::Open(options, path_.native(), &db);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't open database in {}: {}",
               path_,
               status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    db_.reset(db);
    SL_VERBOSE(logger_, "Opened database {}", path_);
  }

  RocksDbStorage::~RocksDbStorage() {
    if (db_) {
      auto status = db_->Close();
      if (not status.ok()) {
        SL_ERROR(logger_, "Can't close database: {}", status.ToString());
      }
    }
  }

  outcome::result<void> RocksDbStorage::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    fs::create_directories(absolute_path, ec);
    if (ec) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path,
               ec);
      return ec;
    }
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path);
      return StorageError::DB_PATH_NOT_CREATED;
    }
    return outcome::success();
  }

  rocksdb::BlockBasedTableOptions RocksDbStorage::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  outcome::result<bool> RocksDbStorage::contains(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<std::string> RocksDbStorage::get(const ByteView &key) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return value;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<std::string>> RocksDbStorage::tryGet(
      const ByteView &key) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(std::move(value));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbStorage::put(const ByteView &key,
                                            std::string &&value) {
    auto status = db_->Put(wo_, make_slice(key), value);
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<bool> RocksDbStorage::remove(const ByteView &key) {
    OUTCOME_TRY(existed, contains(key));
    if (not existed) {
      return false;
    }
    auto status = db_->Delete(wo_, make_slice(key));
    if (status.ok()) {
      return true;
    }

    return status_as_error(status, logger_);
  }

  std::unique_ptr<RocksDbStorage::Cursor> RocksDbStorage::cursor() {
    return std::make_unique<RocksDBCursor>(
        std::unique_ptr<rocksdb::Iterator>(db_->NewIterator(ro_)));
  }

  outcome::result<void> RocksDbStorage::erase() {
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      batch.Delete(it->key());
    }
    if (not it->status().ok()) {
      return status_as_error(it->status(), logger_);
    }
    auto status = db_->Write(wo_, &batch);
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbStorage::flush() {
    auto status = db_->Flush(rocksdb::FlushOptions());
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush database: {}", status.ToString());
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  size_t RocksDbStorage::size() const {
    size_t count = 0;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    return count;
  }

}  // namespace ringstore::storage
