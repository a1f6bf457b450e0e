/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Typedefs of the storage interfaces used by blocks.
 *
 * Keys are binary (qtils::ByteVec) and values are serialized strings.
 */

#pragma once

#include <string>

#include <qtils/byte_vec.hpp>

#include "storage/face/generic_maps.hpp"

namespace ringstore::storage::face {

  /**
   * @brief ViewTrait for ByteVec keys.
   *
   * Resolves to ByteView, providing a view over ByteVec key data.
   */
  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace ringstore::storage::face

namespace ringstore::storage {

  using qtils::ByteVec;
  using qtils::ByteView;

  /// Sorted binary-key to string-value map owned by one block
  using Storage = face::GenericStorage<ByteVec, std::string>;

  using StorageCursor = face::MapCursor<ByteVec, std::string>;

  using StorageEntry = Storage::Entry;

}  // namespace ringstore::storage
