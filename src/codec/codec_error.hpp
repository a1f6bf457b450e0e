/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace ringstore::codec {

  /**
   * @brief Failures of key and value encoding.
   *
   * Codec errors are never retried: they mean either corrupted data or a
   * schema which does not match the stored records.
   */
  enum class CodecError : uint8_t {
    SCHEMA_MISMATCH = 1,  ///< more fields than the schema defines
    CORRUPT_KEY,          ///< binary key can not be decoded
    INVALID_FIELD_VALUE,  ///< value does not fit the field type
    INVALID_PAYLOAD,      ///< value payload can not be encoded or decoded
  };

}  // namespace ringstore::codec

OUTCOME_HPP_DECLARE_ERROR(ringstore::codec, CodecError);
