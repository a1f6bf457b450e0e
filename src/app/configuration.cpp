/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace ringstore::app {

  Configuration::Configuration()
      : version_("undefined"), flush_delay_{std::chrono::seconds(1)} {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const db::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  std::chrono::milliseconds Configuration::flushDelay() const {
    return flush_delay_;
  }

  const Configuration::CommandConfig &Configuration::command() const {
    return command_;
  }

}  // namespace ringstore::app
