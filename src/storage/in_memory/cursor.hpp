/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {

  /**
   * Cursor over InMemoryStorage.
   * Remembers the key of the current entry instead of a map iterator, so
   * removal of that entry does not invalidate the cursor.
   */
  class InMemoryCursor : public StorageCursor {
   public:
    explicit InMemoryCursor(const InMemoryStorage &storage)
        : storage_{storage} {}

    outcome::result<bool> seekFirst() override {
      return moveTo(entries().begin());
    }

    outcome::result<bool> seek(const ByteView &key) override {
      return moveTo(entries().lower_bound(key.toHex()));
    }

    outcome::result<bool> seekLast() override {
      if (entries().empty()) {
        return moveTo(entries().end());
      }
      return moveTo(std::prev(entries().end()));
    }

    bool isValid() const override {
      return current_.has_value();
    }

    outcome::result<void> next() override {
      if (not current_.has_value()) {
        return StorageError::INVALID_ARGUMENT;
      }
      moveTo(entries().upper_bound(*current_));
      return outcome::success();
    }

    outcome::result<void> prev() override {
      if (not current_.has_value()) {
        return StorageError::INVALID_ARGUMENT;
      }
      auto it = entries().lower_bound(*current_);
      moveTo(it == entries().begin() ? entries().end() : std::prev(it));
      return outcome::success();
    }

    std::optional<ByteVec> key() const override {
      if (not current_.has_value()) {
        return std::nullopt;
      }
      return ByteVec::fromHex(*current_).value();
    }

    std::optional<std::string> value() const override {
      if (not current_.has_value()) {
        return std::nullopt;
      }
      auto it = entries().find(*current_);
      if (it == entries().end()) {
        return std::nullopt;
      }
      return it->second;
    }

   private:
    using Entries = decltype(InMemoryStorage::storage_);

    const Entries &entries() const {
      return storage_.storage_;
    }

    bool moveTo(Entries::const_iterator it) {
      if (it == entries().end()) {
        current_.reset();
      } else {
        current_ = it->first;
      }
      return isValid();
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const InMemoryStorage &storage_;
    /// hex key of the entry under the cursor
    std::optional<std::string> current_;
  };

}  // namespace ringstore::storage
