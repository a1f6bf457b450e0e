/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/cursor.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {

  outcome::result<std::string> InMemoryStorage::get(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return it->second;
    }

    return StorageError::NOT_FOUND;
  }

  outcome::result<std::optional<std::string>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return it->second;
    }

    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             std::string &&value) {
    storage_[key.toHex()] = std::move(value);
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    return storage_.contains(key.toHex());
  }

  outcome::result<bool> InMemoryStorage::remove(const ByteView &key) {
    return storage_.erase(key.toHex()) != 0;
  }

  std::unique_ptr<InMemoryStorage::Cursor> InMemoryStorage::cursor() {
    return std::make_unique<InMemoryCursor>(*this);
  }

  outcome::result<void> InMemoryStorage::erase() {
    storage_.clear();
    return outcome::success();
  }

}  // namespace ringstore::storage
