/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/view.hpp"

namespace ringstore::storage::face {

  /**
   * @brief Cursor over a map ordered by key.
   *
   * A cursor is positioned at one entry or is invalid. Navigation past either
   * end leaves it invalid.
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /// @return true if the storage has at least one entry
    virtual outcome::result<bool> seekFirst() = 0;

    /// Positions at the first entry with key not less than `key`
    virtual outcome::result<bool> seek(const View<K> &key) = 0;

    /// @return true if the storage has at least one entry
    virtual outcome::result<bool> seekLast() = 0;

    virtual bool isValid() const = 0;

    virtual outcome::result<void> next() = 0;

    virtual outcome::result<void> prev() = 0;

    virtual std::optional<K> key() const = 0;

    virtual std::optional<V> value() const = 0;
  };

  /**
   * @brief A mixin for a map which can be traversed in key order.
   */
  template <typename K, typename V>
  struct Iterable {
    using Cursor = MapCursor<K, V>;

    virtual ~Iterable() = default;

    /**
     * @brief Creates a cursor over the storage.
     * The cursor must not outlive the storage.
     */
    virtual std::unique_ptr<Cursor> cursor() = 0;
  };

}  // namespace ringstore::storage::face
