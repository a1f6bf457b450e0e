/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "db/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ringstore::db, DatabaseError, e) {
  using E = ringstore::db::DatabaseError;
  switch (e) {
    case E::NOT_FOUND:
      return "object not found in any ring";
    case E::DUPLICATE_ID:
      return "object with this id already exists";
    case E::ID_OUT_OF_RANGE:
      return "id is outside of the valid range of the ring";
    case E::READ_ONLY:
      return "ring is read-only";
    case E::NO_WRITABLE_RING:
      return "no writable ring accepts the object";
    case E::RING_NOT_FOUND:
      return "ring not found";
    case E::RING_NOT_OPEN:
      return "ring must be opened before it is linked";
    case E::DUPLICATE_RING:
      return "ring with this name is already in the database";
    case E::INDEX_NOT_FOUND:
      return "index not found";
    case E::INVALID_INDEX:
      return "index definition is invalid";
  }
  return "unknown DatabaseError";
}
