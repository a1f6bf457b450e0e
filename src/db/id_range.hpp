/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>

namespace ringstore::db {

  using ObjectId = uint64_t;

  /**
   * @brief Write policy of a ring: half-open id range [start, stop) and the
   * read-only flag.
   */
  struct IdRange {
    ObjectId start = 0;
    std::optional<ObjectId> stop;
    bool readonly = false;

    bool contains(ObjectId id) const {
      return start <= id and (not stop.has_value() or id < *stop);
    }

    /// An absent id stands for an id to be assigned by the ring
    bool writable(std::optional<ObjectId> id = std::nullopt) const {
      return not readonly and (not id.has_value() or contains(*id));
    }
  };

}  // namespace ringstore::db
