/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "codec/record_schema.hpp"
#include "db/id_range.hpp"

namespace ringstore::db {

  /**
   * @brief Derived sequence computed from the objects of the data sequence.
   */
  class Index {
   public:
    /// Changes of index records caused by one object change
    struct ChangePlan {
      std::vector<qtils::ByteVec> deletes;
      std::vector<std::pair<qtils::ByteVec, std::string>> puts;

      bool empty() const {
        return deletes.empty() and puts.empty();
      }
    };

    virtual ~Index() = default;

    virtual const std::string &name() const = 0;

    virtual std::shared_ptr<const codec::RecordSchema> schema() const = 0;

    /**
     * Computes index changes for an object transition.
     * Absent data means the object did not exist before, or does not exist
     * after the change.
     */
    virtual outcome::result<ChangePlan> plan(
        ObjectId id,
        const std::optional<std::string> &prev,
        const std::optional<std::string> &next) const = 0;
  };

}  // namespace ringstore::db
