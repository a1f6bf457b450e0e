/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <vector>

#include "db/block.hpp"
#include "db/edit.hpp"
#include "db/id_range.hpp"

namespace ringstore::db {

  /**
   * @brief Block of the primary object sequence of a ring.
   *
   * Adds id-aware CRUD on top of Block. All operations are local: a miss is
   * reported to the caller, which decides where to forward the request.
   */
  class DataBlock final : public Block {
   public:
    struct Updated {
      std::string data;
      /// false when the ring is read-only and `data` must be saved elsewhere
      bool stored;
    };

    DataBlock(qtils::SharedRef<Context> ctx,
              std::string name,
              std::unique_ptr<storage::Storage> storage,
              IdRange range);

    /// Recovers the autoincrement from the highest stored id
    outcome::result<void> open();

    static outcome::result<ByteVec> keyOf(ObjectId id);
    static outcome::result<ObjectId> idOf(const ByteView &key);

    const IdRange &range() const {
      return range_;
    }

    ObjectId autoincrement() const;

    outcome::result<std::optional<std::string>> select(ObjectId id) const;

    /**
     * Stores a new object.
     * Without `id` the next id is max(autoincrement + 1, range start).
     * @return the id of the object, DUPLICATE_ID if the id is already
     * present in this block, ID_OUT_OF_RANGE or READ_ONLY if the ring can't
     * take it, INVALID_JSON if `data` is not JSON text
     */
    outcome::result<ObjectId> insert(std::optional<ObjectId> id,
                                     std::string data);

    /**
     * Applies `edits` to the stored object.
     * @return std::nullopt if the object is not in this block
     */
    outcome::result<std::optional<Updated>> update(
        ObjectId id, const std::vector<Edit> &edits);

    /// Writes `data` under `id` without checking the id range
    outcome::result<void> save(ObjectId id, std::string data);

    outcome::result<bool> remove(ObjectId id);

    outcome::result<std::vector<std::pair<ObjectId, std::string>>> scanIds(
        std::optional<ObjectId> start, std::optional<ObjectId> stop) const;

    outcome::result<void> erase() override;

   private:
    outcome::result<void> checkData(std::string_view data) const;

    IdRange range_;
    // serializes read-modify-write sequences on this block
    mutable std::mutex write_mutex_;
    ObjectId autoincrement_ = 0;
  };

}  // namespace ringstore::db
