/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <fmt/core.h>

/// Paths of rings and index files are logged in normal form
template <>
struct fmt::formatter<std::filesystem::path>
    : fmt::formatter<std::string_view> {
  auto format(const std::filesystem::path &path, format_context &ctx) const {
    auto normal = path.lexically_normal();
    return fmt::formatter<std::string_view>::format(normal.native(), ctx);
  }
};
