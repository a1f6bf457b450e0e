/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

namespace ringstore::app {
  /**
   * YAML of the logging configuration used when the config file has no
   * `logging` section.
   */
  inline constexpr std::string_view kDefaultLoggingYaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: ringstore
        children:
          - name: codec
          - name: storage
          - name: db
          - name: app
)yaml";
}  // namespace ringstore::app
