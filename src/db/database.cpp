/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/database.hpp"

#include <map>
#include <system_error>

#include "db/database_error.hpp"

namespace ringstore::db {

  Database::Database(qtils::SharedRef<Context> ctx)
      : logger_{ctx->logsys->getLogger("Database", log::group::db)},
        ctx_{ctx} {}

  outcome::result<void> Database::open(const DatabaseConfig &config) {
    std::vector<std::shared_ptr<const Index>> indexes;
    try {
      for (const auto &index_config : config.indexes) {
        indexes.emplace_back(std::make_shared<ObjectIndex>(index_config));
      }
    } catch (const std::system_error &e) {
      SL_ERROR(logger_, "Invalid index definition: {}", e.what());
      return e.code();
    }

    for (const auto &ring_config : config.rings) {
      auto ring = std::make_shared<Ring>(ctx_, ring_config, indexes);
      if (auto res = ring->open(); res.has_error()) {
        SL_ERROR(logger_,
                 "Can't open ring {}: {}",
                 ring->name(),
                 res.error());
        return res.error();
      }
      OUTCOME_TRY(append(std::move(ring)));
    }
    SL_INFO(logger_,
            "Database opened with {} rings and {} indexes",
            ringCount(),
            indexes.size());
    return outcome::success();
  }

  outcome::result<void> Database::append(std::shared_ptr<Ring> ring) {
    if (not ring->isOpen()) {
      return DatabaseError::RING_NOT_OPEN;
    }
    std::unique_lock lock{rings_mutex_};
    if (findRingLocked(ring->name()) != nullptr) {
      return DatabaseError::DUPLICATE_RING;
    }
    if (not rings_.empty()) {
      ring->prev_ = rings_.size() - 1;
      rings_.back()->next_ = rings_.size();
    }
    for (const auto &observer : observers_) {
      ring->subscribe(observer);
    }
    SL_DEBUG(logger_,
             "Ring {} linked at position {}",
             ring->name(),
             rings_.size());
    rings_.emplace_back(std::move(ring));
    return outcome::success();
  }

  size_t Database::ringCount() const {
    std::shared_lock lock{rings_mutex_};
    return rings_.size();
  }

  std::shared_ptr<Ring> Database::top() const {
    std::shared_lock lock{rings_mutex_};
    return rings_.empty() ? nullptr : rings_.back();
  }

  std::shared_ptr<Ring> Database::bottom() const {
    std::shared_lock lock{rings_mutex_};
    return rings_.empty() ? nullptr : rings_.front();
  }

  std::shared_ptr<Ring> Database::findRing(const std::string &name) const {
    std::shared_lock lock{rings_mutex_};
    return findRingLocked(name);
  }

  std::shared_ptr<Ring> Database::findRingLocked(
      const std::string &name) const {
    for (const auto &ring : rings_) {
      if (ring->name() == name) {
        return ring;
      }
    }
    return nullptr;
  }

  outcome::result<std::shared_ptr<Ring>> Database::findRingHolding(
      ObjectId id) const {
    std::shared_lock lock{rings_mutex_};
    auto pos = rings_.empty() ? std::nullopt
                              : std::make_optional(rings_.size() - 1);
    while (pos.has_value()) {
      const auto &ring = rings_[*pos];
      OUTCOME_TRY(found, ring->contains(id));
      if (found) {
        return ring;
      }
      pos = ring->prev();
    }
    return nullptr;
  }

  outcome::result<std::string> Database::select(ObjectId id) const {
    OUTCOME_TRY(ring, findRingHolding(id));
    if (ring == nullptr) {
      return DatabaseError::NOT_FOUND;
    }
    OUTCOME_TRY(data, ring->select(id));
    if (not data.has_value()) {
      // removed after the ring was found
      return DatabaseError::NOT_FOUND;
    }
    return std::move(data.value());
  }

  outcome::result<ObjectId> Database::insert(std::string data,
                                             const InsertOptions &options) {
    return insert(std::nullopt, std::move(data), options);
  }

  outcome::result<ObjectId> Database::insert(std::optional<ObjectId> id,
                                             std::string data,
                                             const InsertOptions &options) {
    if (id.has_value()) {
      std::lock_guard id_lock{idMutex(*id)};
      return insertLocked(id, std::move(data), options);
    }
    return insertLocked(std::nullopt, std::move(data), options);
  }

  outcome::result<ObjectId> Database::insertLocked(
      std::optional<ObjectId> id,
      std::string data,
      const InsertOptions &options) {
    std::shared_lock lock{rings_mutex_};

    if (id.has_value() and options.global_unique) {
      for (const auto &ring : rings_) {
        OUTCOME_TRY(found, ring->contains(*id));
        if (found) {
          return DatabaseError::DUPLICATE_ID;
        }
      }
    }

    if (options.ring.has_value()) {
      auto ring = findRingLocked(*options.ring);
      if (ring == nullptr) {
        return DatabaseError::RING_NOT_FOUND;
      }
      return ring->insert(id, std::move(data));
    }

    bool range_refused = false;
    auto pos = rings_.empty() ? std::nullopt
                              : std::make_optional(rings_.size() - 1);
    while (pos.has_value()) {
      const auto &ring = rings_[*pos];
      if (id.has_value()) {
        OUTCOME_TRY(found, ring->contains(*id));
        if (found) {
          return DatabaseError::DUPLICATE_ID;
        }
      }
      if (ring->writable(id)) {
        OUTCOME_TRY(inserted, ring->insert(id, std::move(data)));
        SL_TRACE(logger_, "Object {} inserted into {}", inserted, ring->name());
        return inserted;
      }
      range_refused = range_refused or ring->writable();
      SL_TRACE(logger_, "Ring {} refused insert, forwarding down", ring->name());
      pos = ring->prev();
    }
    if (range_refused) {
      return DatabaseError::ID_OUT_OF_RANGE;
    }
    return DatabaseError::NO_WRITABLE_RING;
  }

  outcome::result<std::string> Database::update(
      ObjectId id, const std::vector<Edit> &edits) {
    std::lock_guard id_lock{idMutex(id)};
    std::shared_lock lock{rings_mutex_};

    auto pos = rings_.empty() ? std::nullopt
                              : std::make_optional(rings_.size() - 1);
    while (pos.has_value()) {
      const auto &ring = rings_[*pos];
      OUTCOME_TRY(updated, ring->update(id, edits));
      if (not updated.has_value()) {
        SL_TRACE(logger_, "Object {} not in {}, forwarding down", id, ring->name());
        pos = ring->prev();
        continue;
      }
      if (updated->stored) {
        return std::move(updated->data);
      }

      // the computed value goes to the first writable ring above
      auto up = ring->next();
      while (up.has_value()) {
        const auto &upper = rings_[*up];
        if (upper->writable()) {
          SL_TRACE(logger_,
                   "Object {} of readonly {} saved to {}",
                   id,
                   ring->name(),
                   upper->name());
          OUTCOME_TRY(upper->save(id, updated->data));
          return std::move(updated->data);
        }
        up = upper->next();
      }
      return DatabaseError::READ_ONLY;
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<bool> Database::remove(ObjectId id) {
    std::lock_guard id_lock{idMutex(id)};
    OUTCOME_TRY(ring, findRingHolding(id));
    if (ring == nullptr) {
      return false;
    }
    if (not ring->writable()) {
      return DatabaseError::READ_ONLY;
    }
    return ring->remove(id);
  }

  outcome::result<std::vector<Database::Entry>> Database::scan(
      std::optional<ObjectId> start, std::optional<ObjectId> stop) const {
    std::shared_lock lock{rings_mutex_};
    std::map<ObjectId, std::string> merged;
    // bottom to top, so that higher rings overwrite shadowed objects
    for (const auto &ring : rings_) {
      OUTCOME_TRY(objects, ring->scan(start, stop));
      for (auto &[id, data] : objects) {
        merged.insert_or_assign(id, std::move(data));
      }
    }
    return std::vector<Entry>{std::make_move_iterator(merged.begin()),
                              std::make_move_iterator(merged.end())};
  }

  outcome::result<std::vector<codec::Record>> Database::scanIndex(
      const std::string &name, const IndexScan &scan) const {
    std::shared_lock lock{rings_mutex_};
    if (rings_.empty()) {
      return DatabaseError::INDEX_NOT_FOUND;
    }
    auto index = rings_.back()->findIndex(name);
    if (index == nullptr) {
      return DatabaseError::INDEX_NOT_FOUND;
    }
    auto schema = index->schema();

    std::optional<ByteVec> start;
    std::optional<ByteVec> stop;
    if (not scan.start.empty()) {
      OUTCOME_TRY(key, schema->encodeKey(scan.start, true));
      start = std::move(key);
    }
    if (not scan.stop.empty()) {
      OUTCOME_TRY(key, schema->encodeKey(scan.stop, true));
      stop = std::move(key);
    }

    std::map<ByteVec, std::string> merged;
    for (const auto &ring : rings_) {
      OUTCOME_TRY(
          entries,
          ring->scanIndex(
              name,
              start ? std::make_optional<ByteView>(*start) : std::nullopt,
              stop ? std::make_optional<ByteView>(*stop) : std::nullopt));
      for (auto &[key, value] : entries) {
        merged.insert_or_assign(std::move(key), std::move(value));
      }
    }

    std::vector<codec::Record> records;
    size_t skipped = 0;
    for (auto &[key, value] : merged) {
      if (skipped < scan.offset) {
        ++skipped;
        continue;
      }
      if (scan.limit.has_value() and records.size() >= *scan.limit) {
        break;
      }
      records.emplace_back(schema, key, std::move(value));
    }
    return records;
  }

  outcome::result<void> Database::rebuildIndexes() {
    std::shared_lock lock{rings_mutex_};
    for (const auto &ring : rings_) {
      OUTCOME_TRY(ring->rebuildIndexes());
    }
    return outcome::success();
  }

  outcome::result<void> Database::flush() {
    std::shared_lock lock{rings_mutex_};
    outcome::result<void> result = outcome::success();
    for (const auto &ring : rings_) {
      if (auto res = ring->flush(); res.has_error()) {
        SL_ERROR(logger_, "Flush of ring {} failed: {}", ring->name(), res.error());
        if (not result.has_error()) {
          result = res.error();
        }
      }
    }
    return result;
  }

  void Database::subscribe(Ring::Observer observer) {
    std::unique_lock lock{rings_mutex_};
    for (const auto &ring : rings_) {
      ring->subscribe(observer);
    }
    observers_.emplace_back(std::move(observer));
  }

}  // namespace ringstore::db
