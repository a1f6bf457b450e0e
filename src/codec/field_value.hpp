/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace ringstore::codec {

  /// Decoded value of a single key field; std::monostate is null
  using FieldValue =
      std::variant<std::monostate, bool, uint64_t, int64_t, std::string>;

  /// Ordered tuple of key fields, possibly shorter than the schema
  using Fields = std::vector<FieldValue>;

  inline bool isNull(const FieldValue &value) {
    return std::holds_alternative<std::monostate>(value);
  }

  inline std::string toString(const FieldValue &value) {
    return std::visit(
        [](const auto &v) -> std::string {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
          } else if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format("\"{}\"", v);
          } else {
            return fmt::format("{}", v);
          }
        },
        value);
  }

}  // namespace ringstore::codec
