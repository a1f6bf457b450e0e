/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "codec/record.hpp"
#include "db/object_index.hpp"
#include "db/ring.hpp"

namespace ringstore::db {

  struct DatabaseConfig {
    /// ordered from the bottom (oldest) to the top (newest)
    std::vector<RingConfig> rings;
    /// every ring maintains all of them
    std::vector<IndexConfig> indexes;
  };

  /**
   * @brief Ordered stack of rings presenting one object namespace.
   *
   * Reads probe rings from the top down and return the first hit. Inserts
   * go to the topmost ring that accepts the id. Updates are applied where
   * the object is found and the computed value is written upwards when
   * that ring is read-only. Scans merge all rings, the higher ring wins on
   * equal keys.
   */
  class Database : NonCopyable, NonMovable {
   public:
    using Entry = std::pair<ObjectId, std::string>;

    struct InsertOptions {
      /// insert into this ring only
      std::optional<std::string> ring;
      /// check an explicit id against all rings, not only the probed ones
      bool global_unique = false;
    };

    struct IndexScan {
      /// leading key fields of the first record
      codec::Fields start;
      /// leading key fields of the record after the range; empty is open
      codec::Fields stop;
      size_t offset = 0;
      std::optional<size_t> limit;
    };

    explicit Database(qtils::SharedRef<Context> ctx);

    /// Creates, opens and links the rings of `config`
    outcome::result<void> open(const DatabaseConfig &config);

    /**
     * Links an opened ring on the top of the stack.
     * @return RING_NOT_OPEN or DUPLICATE_RING
     */
    outcome::result<void> append(std::shared_ptr<Ring> ring);

    size_t ringCount() const;

    std::shared_ptr<Ring> top() const;

    std::shared_ptr<Ring> bottom() const;

    std::shared_ptr<Ring> findRing(const std::string &name) const;

    /// Topmost ring holding the object, nullptr if none does
    outcome::result<std::shared_ptr<Ring>> findRingHolding(ObjectId id) const;

    outcome::result<std::string> select(ObjectId id) const;

    outcome::result<ObjectId> insert(std::string data,
                                     const InsertOptions &options = {});

    outcome::result<ObjectId> insert(std::optional<ObjectId> id,
                                     std::string data,
                                     const InsertOptions &options = {});

    /// @return the new data of the object
    outcome::result<std::string> update(ObjectId id,
                                        const std::vector<Edit> &edits);

    /// @return false if no ring holds the object
    outcome::result<bool> remove(ObjectId id);

    outcome::result<std::vector<Entry>> scan(
        std::optional<ObjectId> start = std::nullopt,
        std::optional<ObjectId> stop = std::nullopt) const;

    outcome::result<std::vector<codec::Record>> scanIndex(
        const std::string &name, const IndexScan &scan = {}) const;

    outcome::result<void> rebuildIndexes();

    /// Flushes every block of every ring immediately
    outcome::result<void> flush();

    /// Registers the observer on every present and future ring
    void subscribe(Ring::Observer observer);

   private:
    static constexpr size_t kIdLocks = 64;

    std::mutex &idMutex(ObjectId id) const {
      return id_mutexes_[id % kIdLocks];
    }

    std::shared_ptr<Ring> findRingLocked(const std::string &name) const;

    outcome::result<ObjectId> insertLocked(std::optional<ObjectId> id,
                                           std::string data,
                                           const InsertOptions &options);

    log::Logger logger_;
    qtils::SharedRef<Context> ctx_;

    mutable std::shared_mutex rings_mutex_;
    /// index is the position in the stack, 0 is the bottom
    std::vector<std::shared_ptr<Ring>> rings_;
    std::vector<Ring::Observer> observers_;

    mutable std::array<std::mutex, kIdLocks> id_mutexes_;
  };

}  // namespace ringstore::db
