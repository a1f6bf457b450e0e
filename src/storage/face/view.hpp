/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace ringstore::storage::face {

  /**
   * @brief Non-owning type used to pass keys of type T into a storage.
   *
   * Specialized next to the concrete key types, see storage_types.hpp.
   */
  template <typename T>
  struct ViewTrait;

  template <typename T>
  using View = typename ViewTrait<T>::type;

}  // namespace ringstore::storage::face
