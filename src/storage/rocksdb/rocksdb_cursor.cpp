/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace ringstore::storage {

  RocksDBCursor::RocksDBCursor(std::unique_ptr<rocksdb::Iterator> it)
      : i_{std::move(it)} {}

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    OUTCOME_TRY(checkStatus());
    return isValid();
  }

  outcome::result<bool> RocksDBCursor::seek(const ByteView &key) {
    i_->Seek(make_slice(key));
    OUTCOME_TRY(checkStatus());
    return isValid();
  }

  outcome::result<bool> RocksDBCursor::seekLast() {
    i_->SeekToLast();
    OUTCOME_TRY(checkStatus());
    return isValid();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    i_->Next();
    return checkStatus();
  }

  outcome::result<void> RocksDBCursor::prev() {
    i_->Prev();
    return checkStatus();
  }

  std::optional<ByteVec> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<std::string> RocksDBCursor::value() const {
    return isValid() ? std::make_optional(i_->value().ToString())
                     : std::nullopt;
  }

  outcome::result<void> RocksDBCursor::checkStatus() const {
    if (auto status = i_->status(); not status.ok()) {
      if (status.IsIOError()) {
        return StorageError::IO_ERROR;
      }
      return StorageError::CORRUPTION;
    }
    return outcome::success();
  }
}  // namespace ringstore::storage
