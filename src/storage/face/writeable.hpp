/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/view.hpp"

namespace ringstore::storage::face {

  /**
   * @brief Interface for modifiable map storage.
   * @tparam K Key type.
   * @tparam V Value type.
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store or update a value by key.
     *
     * @param key   Key to associate with the value.
     * @param value The value to store.
     * @return outcome::result<void> Returns void on success or
     * an error code on failure.
     */
    virtual outcome::result<void> put(const View<K> &key, V &&value) = 0;

    /**
     * @brief Remove a value by key.
     *
     * @param key Key whose mapping should be removed.
     * @return true if the key had a value, false if there was nothing to
     * remove
     */
    virtual outcome::result<bool> remove(const View<K> &key) = 0;
  };

}  // namespace ringstore::storage::face
