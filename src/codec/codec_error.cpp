/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ringstore::codec, CodecError, e) {
  using E = ringstore::codec::CodecError;
  switch (e) {
    case E::SCHEMA_MISMATCH:
      return "number of key fields does not match the record schema";
    case E::CORRUPT_KEY:
      return "binary key is corrupted";
    case E::INVALID_FIELD_VALUE:
      return "value does not fit the field type";
    case E::INVALID_PAYLOAD:
      return "record payload is malformed";
  }
  return "unknown CodecError";
}
