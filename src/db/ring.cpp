/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/ring.hpp"

#include <boost/asio/post.hpp>

#include "db/database_error.hpp"
#include "log/formatters/filepath.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::db {

  Ring::Ring(qtils::SharedRef<Context> ctx,
             RingConfig config,
             std::vector<std::shared_ptr<const Index>> indexes)
      : logger_{ctx->logsys->getLogger("Ring", log::group::db)},
        ctx_{ctx},
        config_{std::move(config)},
        indexes_{std::move(indexes)} {
    if (config_.name.empty()) {
      config_.name = config_.data.path.stem().string();
    }
  }

  storage::StorageSpec Ring::indexStorageSpec(const storage::StorageSpec &data,
                                              const std::string &format,
                                              const std::string &index) {
    if (format == "memory") {
      return {.format = format, .path = {}};
    }
    if (format == "rocksdb") {
      auto path = data.path;
      path += "." + index;
      return {.format = format, .path = std::move(path)};
    }
    auto path = data.path;
    path.replace_extension();
    path += "." + index + ".jl";
    return {.format = "jl", .path = std::move(path)};
  }

  outcome::result<void> Ring::open() {
    if (isOpen()) {
      return outcome::success();
    }

    auto format = config_.data.format;
    if (format.empty()) {
      auto by_extension = ctx_->storage_factory.formatOf(config_.data.path);
      if (not by_extension.has_value()) {
        SL_ERROR(logger_,
                 "Ring {}: can't choose storage format for {}",
                 name(),
                 config_.data.path);
        return storage::StorageError::UNKNOWN_FORMAT;
      }
      format = by_extension.value();
    }

    // ids of newer rings can't be here, older ids may be shadow copies
    auto validator = [stop{config_.range.stop}](const ByteView &key) {
      auto id = DataBlock::idOf(key);
      return id.has_value() and (not stop.has_value() or id.value() < *stop);
    };
    OUTCOME_TRY(storage,
                ctx_->storage_factory.create(
                    {.format = format, .path = config_.data.path}, validator));

    auto data = std::make_shared<DataBlock>(
        ctx_, config_.name, std::move(storage), config_.range);
    OUTCOME_TRY(data->open());
    data_ = std::move(data);

    for (const auto &index : indexes_) {
      OUTCOME_TRY(openIndexBlock(format, index));
    }

    data_->setPropagator([weak_self{weak_from_this()}](
                             const ByteVec &key,
                             const std::optional<std::string> &prev,
                             const std::optional<std::string> &next) {
      if (auto self = weak_self.lock()) {
        self->propagate(key, prev, next);
      }
    });

    SL_VERBOSE(logger_,
               "Ring {} opened: {} objects, {} indexes, ids [{}, {}){}",
               name(),
               data_->size(),
               index_blocks_.size(),
               config_.range.start,
               config_.range.stop ? std::to_string(*config_.range.stop)
                                  : "inf",
               config_.range.readonly ? ", readonly" : "");
    return outcome::success();
  }

  outcome::result<void> Ring::openIndexBlock(
      const std::string &format, std::shared_ptr<const Index> index) {
    auto spec = indexStorageSpec(config_.data, format, index->name());
    OUTCOME_TRY(storage, ctx_->storage_factory.create(spec));
    auto block = std::make_shared<Block>(
        ctx_, config_.name + "." + index->name(), std::move(storage));

    IndexBlock index_block{.index = std::move(index), .block = block};
    if (block->size() == 0 and data_->size() != 0) {
      SL_INFO(logger_,
              "Ring {}: index {} is empty, deriving it from data",
              name(),
              index_block.index->name());
      OUTCOME_TRY(objects, data_->scanIds(std::nullopt, std::nullopt));
      for (auto &[id, data] : objects) {
        OUTCOME_TRY(applyToIndex(index_block, id, std::nullopt, data));
      }
      OUTCOME_TRY(block->flush());
    }
    index_blocks_.emplace_back(std::move(index_block));
    return outcome::success();
  }

  outcome::result<std::shared_ptr<DataBlock>> Ring::dataBlock() const {
    if (not data_) {
      return DatabaseError::RING_NOT_OPEN;
    }
    return data_;
  }

  outcome::result<bool> Ring::contains(ObjectId id) const {
    OUTCOME_TRY(data, select(id));
    return data.has_value();
  }

  outcome::result<std::optional<std::string>> Ring::select(ObjectId id) const {
    OUTCOME_TRY(data, dataBlock());
    return data->select(id);
  }

  outcome::result<ObjectId> Ring::insert(std::optional<ObjectId> id,
                                         std::string data) {
    OUTCOME_TRY(block, dataBlock());
    return block->insert(id, std::move(data));
  }

  outcome::result<std::optional<DataBlock::Updated>> Ring::update(
      ObjectId id, const std::vector<Edit> &edits) {
    OUTCOME_TRY(block, dataBlock());
    return block->update(id, edits);
  }

  outcome::result<void> Ring::save(ObjectId id, std::string data) {
    OUTCOME_TRY(block, dataBlock());
    return block->save(id, std::move(data));
  }

  outcome::result<bool> Ring::remove(ObjectId id) {
    OUTCOME_TRY(block, dataBlock());
    return block->remove(id);
  }

  outcome::result<std::vector<std::pair<ObjectId, std::string>>> Ring::scan(
      std::optional<ObjectId> start, std::optional<ObjectId> stop) const {
    OUTCOME_TRY(block, dataBlock());
    return block->scanIds(start, stop);
  }

  std::shared_ptr<const Index> Ring::findIndex(const std::string &name) const {
    for (const auto &index : indexes_) {
      if (index->name() == name) {
        return index;
      }
    }
    return nullptr;
  }

  outcome::result<std::vector<StorageEntry>> Ring::scanIndex(
      const std::string &name,
      const std::optional<ByteView> &start,
      const std::optional<ByteView> &stop) const {
    if (not isOpen()) {
      return DatabaseError::RING_NOT_OPEN;
    }
    for (const auto &index_block : index_blocks_) {
      if (index_block.index->name() == name) {
        return index_block.block->scan(start, stop);
      }
    }
    return DatabaseError::INDEX_NOT_FOUND;
  }

  outcome::result<void> Ring::rebuildIndexes() {
    OUTCOME_TRY(data, dataBlock());
    OUTCOME_TRY(objects, data->scanIds(std::nullopt, std::nullopt));
    for (const auto &index_block : index_blocks_) {
      OUTCOME_TRY(index_block.block->erase());
      for (auto &[id, object] : objects) {
        OUTCOME_TRY(applyToIndex(index_block, id, std::nullopt, object));
      }
      OUTCOME_TRY(index_block.block->flush());
    }
    SL_INFO(logger_,
            "Ring {}: rebuilt {} indexes over {} objects",
            name(),
            index_blocks_.size(),
            objects.size());
    return outcome::success();
  }

  outcome::result<void> Ring::erase() {
    OUTCOME_TRY(data, dataBlock());
    if (config_.range.readonly) {
      return DatabaseError::READ_ONLY;
    }
    OUTCOME_TRY(data->erase());
    for (const auto &index_block : index_blocks_) {
      OUTCOME_TRY(index_block.block->erase());
    }
    SL_INFO(logger_, "Ring {} erased", name());
    return outcome::success();
  }

  outcome::result<void> Ring::flush() {
    OUTCOME_TRY(data, dataBlock());
    OUTCOME_TRY(data->flush());
    for (const auto &index_block : index_blocks_) {
      OUTCOME_TRY(index_block.block->flush());
    }
    return outcome::success();
  }

  void Ring::subscribe(Observer observer) {
    std::unique_lock lock{observers_mutex_};
    observers_.emplace_back(std::move(observer));
  }

  ObjectId Ring::autoincrement() const {
    return data_ ? data_->autoincrement() : 0;
  }

  void Ring::propagate(const ByteVec &key,
                       const std::optional<std::string> &prev,
                       const std::optional<std::string> &next) {
    auto id_res = DataBlock::idOf(key);
    if (id_res.has_error()) {
      SL_ERROR(logger_,
               "Ring {}: can't propagate change of key {}: {}",
               name(),
               key.toHex(),
               id_res.error());
      return;
    }
    auto id = id_res.value();

    for (const auto &index_block : index_blocks_) {
      boost::asio::post(
          *ctx_->io_context,
          [weak_self{weak_from_this()}, index_block, id, prev, next] {
            auto self = weak_self.lock();
            if (not self) {
              return;
            }
            auto res = self->applyToIndex(index_block, id, prev, next);
            if (res.has_error()) {
              SL_ERROR(self->logger_,
                       "Ring {}: index {} not updated for object {}: {}",
                       self->name(),
                       index_block.index->name(),
                       id,
                       res.error());
            }
          });
    }

    std::vector<Observer> observers;
    {
      std::shared_lock lock{observers_mutex_};
      observers = observers_;
    }
    if (observers.empty()) {
      return;
    }
    // observers may call back into the database, so not under its locks
    boost::asio::post(*ctx_->io_context,
                      [observers{std::move(observers)},
                       ring{name()},
                       id,
                       prev,
                       next] {
                        for (const auto &observer : observers) {
                          observer(ring, id, prev, next);
                        }
                      });
  }

  outcome::result<void> Ring::applyToIndex(
      const IndexBlock &index_block,
      ObjectId id,
      const std::optional<std::string> &prev,
      const std::optional<std::string> &next) {
    OUTCOME_TRY(plan, index_block.index->plan(id, prev, next));
    for (const auto &key : plan.deletes) {
      OUTCOME_TRY(index_block.block->del(key));
    }
    for (auto &[key, value] : plan.puts) {
      OUTCOME_TRY(index_block.block->put(key, std::move(value)));
    }
    SL_TRACE(logger_,
             "Ring {}: index {} of object {}: -{} +{}",
             name(),
             index_block.index->name(),
             id,
             plan.deletes.size(),
             plan.puts.size());
    return outcome::success();
  }

}  // namespace ringstore::db
