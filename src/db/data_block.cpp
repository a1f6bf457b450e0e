/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/data_block.hpp"

#include <limits>

#include "codec/codec_error.hpp"
#include "codec/record_schema.hpp"
#include "db/database_error.hpp"
#include "serde/json.hpp"

namespace ringstore::db {

  DataBlock::DataBlock(qtils::SharedRef<Context> ctx,
                       std::string name,
                       std::unique_ptr<storage::Storage> storage,
                       IdRange range)
      : Block{std::move(ctx), std::move(name), std::move(storage)},
        range_{range} {}

  outcome::result<ByteVec> DataBlock::keyOf(ObjectId id) {
    return codec::RecordSchema::objectIds().encodeKey({codec::FieldValue{id}});
  }

  outcome::result<ObjectId> DataBlock::idOf(const ByteView &key) {
    OUTCOME_TRY(fields, codec::RecordSchema::objectIds().decodeKey(key));
    if (auto id = std::get_if<uint64_t>(&fields.front())) {
      return *id;
    }
    return codec::CodecError::CORRUPT_KEY;
  }

  outcome::result<void> DataBlock::open() {
    std::lock_guard lock{write_mutex_};
    OUTCOME_TRY(entries, scan(std::nullopt, std::nullopt));
    autoincrement_ = 0;
    if (not entries.empty()) {
      OUTCOME_TRY(id, idOf(entries.back().first));
      autoincrement_ = id;
    }
    SL_DEBUG(logger_,
             "{}: opened with {} objects, autoincrement {}",
             name(),
             entries.size(),
             autoincrement_);
    return outcome::success();
  }

  ObjectId DataBlock::autoincrement() const {
    std::lock_guard lock{write_mutex_};
    return autoincrement_;
  }

  outcome::result<std::optional<std::string>> DataBlock::select(
      ObjectId id) const {
    OUTCOME_TRY(key, keyOf(id));
    return get(key);
  }

  outcome::result<void> DataBlock::checkData(std::string_view data) const {
    if (json::parse(data).has_error()) {
      SL_DEBUG(logger_, "{}: refused object data which is not JSON", name());
      return EditError::INVALID_JSON;
    }
    return outcome::success();
  }

  outcome::result<ObjectId> DataBlock::insert(std::optional<ObjectId> id,
                                              std::string data) {
    std::lock_guard lock{write_mutex_};
    if (range_.readonly) {
      return DatabaseError::READ_ONLY;
    }
    OUTCOME_TRY(checkData(data));
    if (not id.has_value()
        and autoincrement_ == std::numeric_limits<ObjectId>::max()) {
      return DatabaseError::ID_OUT_OF_RANGE;
    }
    auto candidate = id.value_or(std::max(autoincrement_ + 1, range_.start));
    if (not range_.contains(candidate)) {
      SL_DEBUG(logger_,
               "{}: id {} is outside of [{}, {})",
               name(),
               candidate,
               range_.start,
               range_.stop ? std::to_string(*range_.stop) : "inf");
      return DatabaseError::ID_OUT_OF_RANGE;
    }

    OUTCOME_TRY(key, keyOf(candidate));
    OUTCOME_TRY(existing, get(key));
    if (existing.has_value()) {
      return DatabaseError::DUPLICATE_ID;
    }

    // a failed flush below still leaves the object stored
    autoincrement_ = std::max(autoincrement_, candidate);
    OUTCOME_TRY(put(key, std::move(data)));
    return candidate;
  }

  outcome::result<std::optional<DataBlock::Updated>> DataBlock::update(
      ObjectId id, const std::vector<Edit> &edits) {
    std::lock_guard lock{write_mutex_};
    OUTCOME_TRY(key, keyOf(id));
    OUTCOME_TRY(current, get(key));
    if (not current.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(data, applyEdits(*current, edits));
    if (range_.readonly) {
      return Updated{.data = std::move(data), .stored = false};
    }
    OUTCOME_TRY(put(key, data));
    return Updated{.data = std::move(data), .stored = true};
  }

  outcome::result<void> DataBlock::save(ObjectId id, std::string data) {
    std::lock_guard lock{write_mutex_};
    if (range_.readonly) {
      return DatabaseError::READ_ONLY;
    }
    OUTCOME_TRY(checkData(data));
    OUTCOME_TRY(key, keyOf(id));
    autoincrement_ = std::max(autoincrement_, id);
    return put(key, std::move(data));
  }

  outcome::result<bool> DataBlock::remove(ObjectId id) {
    std::lock_guard lock{write_mutex_};
    OUTCOME_TRY(key, keyOf(id));
    OUTCOME_TRY(existing, get(key));
    if (not existing.has_value()) {
      return false;
    }
    if (range_.readonly) {
      return DatabaseError::READ_ONLY;
    }
    return del(key);
  }

  outcome::result<std::vector<std::pair<ObjectId, std::string>>>
  DataBlock::scanIds(std::optional<ObjectId> start,
                     std::optional<ObjectId> stop) const {
    std::optional<ByteVec> start_key;
    std::optional<ByteVec> stop_key;
    if (start.has_value()) {
      OUTCOME_TRY(key, keyOf(*start));
      start_key = std::move(key);
    }
    if (stop.has_value()) {
      OUTCOME_TRY(key, keyOf(*stop));
      stop_key = std::move(key);
    }
    OUTCOME_TRY(entries,
                scan(start_key ? std::make_optional<ByteView>(*start_key)
                               : std::nullopt,
                     stop_key ? std::make_optional<ByteView>(*stop_key)
                              : std::nullopt));

    std::vector<std::pair<ObjectId, std::string>> objects;
    objects.reserve(entries.size());
    for (auto &[key, value] : entries) {
      OUTCOME_TRY(id, idOf(key));
      objects.emplace_back(id, std::move(value));
    }
    return objects;
  }

  outcome::result<void> DataBlock::erase() {
    std::lock_guard lock{write_mutex_};
    autoincrement_ = 0;
    return Block::erase();
  }

}  // namespace ringstore::db
