/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/storage_types.hpp"

namespace ringstore::storage {

  /**
   * Storage kept entirely in memory.
   * Keys are held hex-encoded, which keeps the byte-wise key order of the
   * map. Also the base of the file backends, which load all entries on open.
   */
  class InMemoryStorage : public Storage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<std::string> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<std::string>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              std::string &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<bool> remove(const ByteView &key) override;

    std::unique_ptr<Cursor> cursor() override;

    outcome::result<void> erase() override;

    [[nodiscard]] size_t size() const override {
      return storage_.size();
    }

   private:
    std::map<std::string, std::string> storage_;

    friend class InMemoryCursor;
  };

}  // namespace ringstore::storage
