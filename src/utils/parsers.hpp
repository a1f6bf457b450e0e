/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ringstore::util {

  /**
   * Case-insensitive comparison of two string views.
   *
   * @param lhs First string view
   * @param rhs Second string view
   * @return true if strings are equal ignoring case, false otherwise
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  /**
   * Parses a delay like "250", "250ms", "2s" or "1 min".
   *
   * A bare number is taken as milliseconds. Recognized suffixes
   * (case-insensitive): ms, s, sec, m, min, h, hour.
   *
   * @param input string representation of the delay
   * @return delay if parsing succeeded, std::nullopt otherwise
   */
  inline std::optional<std::chrono::milliseconds> parseDelay(
      std::string_view input) {
    // Trim whitespace
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return std::nullopt;
    }
    auto last = input.find_last_not_of(" \t\n\r");
    input = input.substr(first, last - first + 1);

    // Parse number
    size_t i = 0;
    while (i < input.size() && std::isdigit(input[i])) {
      ++i;
    }
    if (i == 0) {
      return std::nullopt;
    }

    std::string_view number_part = input.substr(0, i);
    while (i < input.size()
           && std::isspace(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    std::string_view suffix = input.substr(i);

    uint64_t number = 0;
    auto [ptr, ec] =
        std::from_chars(number_part.begin(), number_part.end(), number);
    if (ec != std::errc()) {
      return std::nullopt;
    }

    if (suffix.empty()) {
      return std::chrono::milliseconds(number);
    }

    struct Entry {
      std::string_view suffix;
      uint64_t multiplier;
    };
    static constexpr Entry suffixes[] = {
        {"ms", 1},
        {"s", 1000},
        {"sec", 1000},
        {"m", 60'000},
        {"min", 60'000},
        {"h", 3'600'000},
        {"hour", 3'600'000},
    };

    for (const auto &[table_suffix, multiplier] : suffixes) {
      if (iequals(table_suffix, suffix)) {
        if (number > INT64_MAX / multiplier) {
          return std::nullopt;
        }
        return std::chrono::milliseconds(number * multiplier);
      }
    }

    return std::nullopt;
  }

}  // namespace ringstore::util
