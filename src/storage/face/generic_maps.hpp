/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Composite interface for generic key-value storage.
 *
 * Combines readable, writable and iterable support into a single storage
 * abstraction with ordered range scans.
 */

#pragma once

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

#include "storage/face/iterable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace ringstore::storage::face {

  /**
   * @brief Abstraction over a sorted key-value storage.
   * @tparam K Key type.
   * @tparam V Value type.
   *
   * Keys are ordered by byte-wise comparison. Scans always return entries in
   * ascending key order regardless of insertion order.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Iterable<K, V>, Writeable<K, V> {
    using Entry = std::pair<K, V>;

    /**
     * @brief Snapshot of the half-open key range [start, stop).
     * @param start first key of the range, unbounded if empty
     * @param stop key after the range, unbounded if empty
     */
    virtual outcome::result<std::vector<Entry>> scan(
        const std::optional<View<K>> &start,
        const std::optional<View<K>> &stop) {
      auto cursor = this->cursor();
      if (start.has_value()) {
        OUTCOME_TRY(cursor->seek(start.value()));
      } else {
        OUTCOME_TRY(cursor->seekFirst());
      }
      std::vector<Entry> entries;
      while (cursor->isValid()) {
        auto key = cursor->key().value();
        if (stop.has_value()
            and not std::ranges::lexicographical_compare(key, stop.value())) {
          break;
        }
        entries.emplace_back(std::move(key), cursor->value().value());
        OUTCOME_TRY(cursor->next());
      }
      return entries;
    }

    /// Removes all entries
    virtual outcome::result<void> erase() = 0;

    /**
     * @brief Persists the contents to the durable medium.
     * No-op for storages without one.
     */
    virtual outcome::result<void> flush() {
      return outcome::success();
    }

    /// Number of entries
    [[nodiscard]] virtual size_t size() const = 0;
  };

}  // namespace ringstore::storage::face
