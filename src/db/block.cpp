/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/block.hpp"

#include <boost/asio/error.hpp>

namespace ringstore::db {

  Block::Block(qtils::SharedRef<Context> ctx,
               std::string name,
               std::unique_ptr<storage::Storage> storage)
      : logger_{ctx->logsys->getLogger("Block", log::group::db)},
        ctx_{ctx},
        name_{std::move(name)},
        storage_{std::move(storage)},
        flush_timer_{*ctx->io_context} {
    BOOST_ASSERT(storage_ != nullptr);
  }

  Block::~Block() {
    if (dirty_) {
      SL_WARN(logger_, "Block {} destroyed with unsaved changes", name_);
    }
  }

  void Block::setPropagator(Propagator propagator) {
    propagator_ = std::move(propagator);
  }

  bool Block::dirty() const {
    std::lock_guard lock{mutex_};
    return dirty_;
  }

  size_t Block::size() const {
    std::lock_guard lock{mutex_};
    return storage_->size();
  }

  outcome::result<std::optional<std::string>> Block::get(
      const ByteView &key) const {
    std::lock_guard lock{mutex_};
    return storage_->tryGet(key);
  }

  outcome::result<void> Block::put(const ByteView &key, std::string value) {
    std::optional<std::string> prev;
    std::optional<std::string> next{value};
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(old, storage_->tryGet(key));
      prev = std::move(old);
      OUTCOME_TRY(storage_->put(key, std::move(value)));
      dirty_ = true;
    }
    SL_TRACE(logger_, "{}: put {}", name_, key.toHex());
    propagate(ByteVec(key.begin(), key.end()), prev, next);
    return flushAfterChange();
  }

  outcome::result<bool> Block::del(const ByteView &key) {
    std::optional<std::string> prev;
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(old, storage_->tryGet(key));
      if (not old.has_value()) {
        return false;
      }
      prev = std::move(old);
      OUTCOME_TRY(storage_->remove(key));
      dirty_ = true;
    }
    SL_TRACE(logger_, "{}: delete {}", name_, key.toHex());
    propagate(ByteVec(key.begin(), key.end()), prev, std::nullopt);
    OUTCOME_TRY(flushAfterChange());
    return true;
  }

  outcome::result<std::vector<StorageEntry>> Block::scan(
      const std::optional<ByteView> &start,
      const std::optional<ByteView> &stop) const {
    std::lock_guard lock{mutex_};
    return storage_->scan(start, stop);
  }

  outcome::result<void> Block::erase() {
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(storage_->erase());
      dirty_ = true;
    }
    SL_DEBUG(logger_, "{}: erased", name_);
    return flush();
  }

  outcome::result<void> Block::flush(std::chrono::milliseconds debounce) {
    std::lock_guard lock{mutex_};
    if (deferred_error_.has_value()) {
      auto ec = *deferred_error_;
      deferred_error_.reset();
      return ec;
    }
    if (not dirty_) {
      return outcome::success();
    }

    if (debounce == std::chrono::milliseconds::zero()) {
      return flushLocked();
    }

    armFlushTimerLocked(debounce);
    return outcome::success();
  }

  outcome::result<void> Block::flushAfterChange() {
    std::lock_guard lock{mutex_};
    if (ctx_->flush_delay == std::chrono::milliseconds::zero()) {
      return flushLocked();
    }
    armFlushTimerLocked(ctx_->flush_delay);
    return outcome::success();
  }

  void Block::armFlushTimerLocked(std::chrono::milliseconds debounce) {
    // re-arming aborts the wait scheduled before
    flush_pending_ = true;
    flush_timer_.expires_after(debounce);
    flush_timer_.async_wait(
        [weak_self{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          if (auto self = weak_self.lock()) {
            self->onFlushTimer();
          }
        });
  }

  outcome::result<void> Block::flushLocked() {
    if (flush_pending_) {
      flush_timer_.cancel();
      flush_pending_ = false;
    }
    OUTCOME_TRY(storage_->flush());
    dirty_ = false;
    SL_DEBUG(logger_, "{}: flushed", name_);
    return outcome::success();
  }

  void Block::onFlushTimer() {
    std::lock_guard lock{mutex_};
    flush_pending_ = false;
    if (not dirty_) {
      return;
    }
    if (auto res = flushLocked(); res.has_error()) {
      SL_ERROR(logger_, "{}: deferred flush failed: {}", name_, res.error());
      deferred_error_ = res.error();
    }
  }

  void Block::propagate(const ByteVec &key,
                        const std::optional<std::string> &prev,
                        const std::optional<std::string> &next) const {
    if (propagator_) {
      propagator_(key, prev, next);
    }
  }

}  // namespace ringstore::db
