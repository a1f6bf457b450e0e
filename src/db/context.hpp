/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/storage_factory.hpp"

namespace ringstore::db {

  /**
   * @brief Services shared by every component of one database.
   *
   * Passed explicitly into constructors; lives as long as the longest
   * holder of the shared reference.
   */
  struct Context {
    Context(qtils::SharedRef<log::LoggingSystem> logsys,
            std::shared_ptr<boost::asio::io_context> io_context,
            std::chrono::milliseconds flush_delay)
        : logsys{logsys},
          io_context{std::move(io_context)},
          flush_delay{flush_delay},
          storage_factory{logsys} {}

    qtils::SharedRef<log::LoggingSystem> logsys;
    /// Runs debounced flushes and index propagation
    std::shared_ptr<boost::asio::io_context> io_context;
    /// Debounce window of flushes after mutations; zero flushes immediately
    std::chrono::milliseconds flush_delay;
    storage::StorageFactory storage_factory;
  };

}  // namespace ringstore::db
