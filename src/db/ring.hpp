/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <shared_mutex>

#include "db/data_block.hpp"
#include "db/index.hpp"

namespace ringstore::db {

  struct RingConfig {
    /// Defaults to the stem of the data file
    std::string name;
    storage::StorageSpec data;
    IdRange range;
  };

  /**
   * @brief One layer of the database: a data block plus a block per index.
   *
   * Operations of a ring are local. Forwarding to neighbours is done by the
   * Database, which keeps the positions of the neighbours in `prev()` and
   * `next()`.
   */
  class Ring final : public std::enable_shared_from_this<Ring>,
                     NonCopyable,
                     NonMovable {
   public:
    /// Receives committed changes of objects; called on the io context
    /// after the index updates of the same change
    using Observer =
        std::function<void(const std::string &ring,
                           ObjectId id,
                           const std::optional<std::string> &prev,
                           const std::optional<std::string> &next)>;

    Ring(qtils::SharedRef<Context> ctx,
         RingConfig config,
         std::vector<std::shared_ptr<const Index>> indexes = {});

    /// Creates and loads the storages of all blocks
    outcome::result<void> open();

    bool isOpen() const {
      return data_ != nullptr;
    }

    const std::string &name() const {
      return config_.name;
    }

    const IdRange &range() const {
      return config_.range;
    }

    bool writable(std::optional<ObjectId> id = std::nullopt) const {
      return config_.range.writable(id);
    }

    /// Storage of the index block `index` of a ring stored in `data`
    static storage::StorageSpec indexStorageSpec(
        const storage::StorageSpec &data,
        const std::string &format,
        const std::string &index);

    std::optional<size_t> prev() const {
      return prev_;
    }

    std::optional<size_t> next() const {
      return next_;
    }

    outcome::result<bool> contains(ObjectId id) const;

    outcome::result<std::optional<std::string>> select(ObjectId id) const;

    outcome::result<ObjectId> insert(std::optional<ObjectId> id,
                                     std::string data);

    outcome::result<std::optional<DataBlock::Updated>> update(
        ObjectId id, const std::vector<Edit> &edits);

    outcome::result<void> save(ObjectId id, std::string data);

    outcome::result<bool> remove(ObjectId id);

    outcome::result<std::vector<std::pair<ObjectId, std::string>>> scan(
        std::optional<ObjectId> start, std::optional<ObjectId> stop) const;

    /// Records of index `name` with binary keys in [start, stop)
    outcome::result<std::vector<StorageEntry>> scanIndex(
        const std::string &name,
        const std::optional<ByteView> &start,
        const std::optional<ByteView> &stop) const;

    std::shared_ptr<const Index> findIndex(const std::string &name) const;

    /// Clears index blocks and derives them again from the data block
    outcome::result<void> rebuildIndexes();

    /// Removes all objects and index records
    outcome::result<void> erase();

    /// Flushes all blocks immediately
    outcome::result<void> flush();

    void subscribe(Observer observer);

    ObjectId autoincrement() const;

   private:
    friend class Database;

    struct IndexBlock {
      std::shared_ptr<const Index> index;
      std::shared_ptr<Block> block;
    };

    void propagate(const ByteVec &key,
                   const std::optional<std::string> &prev,
                   const std::optional<std::string> &next);

    outcome::result<void> applyToIndex(const IndexBlock &index_block,
                                       ObjectId id,
                                       const std::optional<std::string> &prev,
                                       const std::optional<std::string> &next);

    outcome::result<std::shared_ptr<DataBlock>> dataBlock() const;
    outcome::result<void> openIndexBlock(const std::string &format,
                                         std::shared_ptr<const Index> index);

    log::Logger logger_;
    qtils::SharedRef<Context> ctx_;
    RingConfig config_;
    std::vector<std::shared_ptr<const Index>> indexes_;

    std::shared_ptr<DataBlock> data_;
    std::vector<IndexBlock> index_blocks_;

    mutable std::shared_mutex observers_mutex_;
    std::vector<Observer> observers_;

    std::optional<size_t> prev_;
    std::optional<size_t> next_;
  };

}  // namespace ringstore::db
