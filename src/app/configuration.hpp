/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <utils/ctor_limiters.hpp>

#include "db/database.hpp"

namespace ringstore::app {
  class Configuration : Singleton<Configuration> {
   public:
    /// Command of the command-line tool with its arguments
    struct CommandConfig {
      std::string name;
      std::vector<std::string> args;
      std::optional<db::ObjectId> id;
      std::optional<std::string> target;
      bool global_unique = false;
      std::optional<std::string> start;
      std::optional<std::string> stop;
      size_t offset = 0;
      std::optional<size_t> limit;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const db::DatabaseConfig &database() const;
    [[nodiscard]] virtual std::chrono::milliseconds flushDelay() const;

    [[nodiscard]] virtual const CommandConfig &command() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::filesystem::path base_path_;

    db::DatabaseConfig database_;
    std::chrono::milliseconds flush_delay_;

    CommandConfig command_;
  };

}  // namespace ringstore::app
