/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/file/file_storage.hpp"

namespace ringstore::storage {

  /**
   * @brief Records kept as newline-delimited JSON.
   *
   * Each line is a JSON array with the key bytes as an array of integers,
   * followed by the value string unless the value is empty:
   * @code
   * [[1,5,0,0]]
   * [[1,7,0,0],"\"title\",3"]
   * @endcode
   * Used for index sequences, whose keys are arbitrary binary strings.
   */
  class JsonLinesStorage final : public FileStorage {
   public:
    using FileStorage::FileStorage;

   protected:
    outcome::result<std::vector<StorageEntry>> parse(
        std::istream &in) const override;

    outcome::result<void> serialize(
        std::ostream &out,
        const std::vector<StorageEntry> &entries) const override;
  };

}  // namespace ringstore::storage
