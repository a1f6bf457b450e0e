/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace ringstore::db {

  enum class DatabaseError : uint8_t {
    NOT_FOUND = 1,
    DUPLICATE_ID,
    ID_OUT_OF_RANGE,
    READ_ONLY,
    NO_WRITABLE_RING,
    RING_NOT_FOUND,
    RING_NOT_OPEN,
    DUPLICATE_RING,
    INDEX_NOT_FOUND,
    INVALID_INDEX,
  };

}  // namespace ringstore::db

OUTCOME_HPP_DECLARE_ERROR(ringstore::db, DatabaseError);
