/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#ifndef RINGSTORE_VERSION
#define RINGSTORE_VERSION "undefined"
#endif

namespace ringstore {
  /**
   * Version of the build, set by the build system.
   */
  inline const std::string &buildVersion() {
    static const std::string version{RINGSTORE_VERSION};
    return version;
  }
}  // namespace ringstore
