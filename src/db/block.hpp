/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <qtils/shared_ref.hpp>

#include "db/context.hpp"
#include "log/logger.hpp"
#include "storage/storage_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace ringstore::db {

  using storage::ByteVec;
  using storage::ByteView;
  using storage::StorageEntry;

  /**
   * @brief Physical container of one sequence inside a ring.
   *
   * Exclusively owns its storage. Every successful mutation marks the block
   * dirty, notifies the propagator once and schedules a debounced flush.
   * Must be owned by std::shared_ptr.
   */
  class Block : public std::enable_shared_from_this<Block>,
                NonCopyable,
                NonMovable {
   public:
    /// Receives every committed change of a key; absent value means none
    using Propagator =
        std::function<void(const ByteVec &key,
                           const std::optional<std::string> &prev,
                           const std::optional<std::string> &next)>;

    Block(qtils::SharedRef<Context> ctx,
          std::string name,
          std::unique_ptr<storage::Storage> storage);

    virtual ~Block();

    const std::string &name() const {
      return name_;
    }

    void setPropagator(Propagator propagator);

    bool dirty() const;

    size_t size() const;

    outcome::result<std::optional<std::string>> get(const ByteView &key) const;

    outcome::result<void> put(const ByteView &key, std::string value);

    /// @return whether the key existed
    outcome::result<bool> del(const ByteView &key);

    outcome::result<std::vector<StorageEntry>> scan(
        const std::optional<ByteView> &start,
        const std::optional<ByteView> &stop) const;

    /// Removes all records and flushes immediately; no propagation
    virtual outcome::result<void> erase();

    /**
     * @brief Persists the block if dirty.
     *
     * With zero `debounce` the storage is flushed now. Otherwise a single
     * flush is scheduled after `debounce`; calling again before it fires
     * re-arms the timer, so a burst of mutations gives one write.
     * An error of an earlier deferred flush is returned by the next call.
     */
    outcome::result<void> flush(
        std::chrono::milliseconds debounce = std::chrono::milliseconds::zero());

   protected:
    log::Logger logger_;
    qtils::SharedRef<Context> ctx_;

   private:
    /// Flush after a committed mutation; leaves deferred errors for `flush`
    outcome::result<void> flushAfterChange();
    outcome::result<void> flushLocked();
    void armFlushTimerLocked(std::chrono::milliseconds debounce);
    void onFlushTimer();

    void propagate(const ByteVec &key,
                   const std::optional<std::string> &prev,
                   const std::optional<std::string> &next) const;

    std::string name_;

    mutable std::mutex mutex_;
    std::unique_ptr<storage::Storage> storage_;
    bool dirty_ = false;
    boost::asio::steady_timer flush_timer_;
    bool flush_pending_ = false;
    std::optional<std::error_code> deferred_error_;

    Propagator propagator_;
  };

}  // namespace ringstore::db
