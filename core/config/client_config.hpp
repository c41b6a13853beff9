/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "config/config.hpp"

namespace mdag::config {
  /// Environment variable overriding default endpoint
  constexpr auto kApiEnv{"IPFS_API"};

  /**
   * Client settings: where the api is and how verbose logging is.
   * Sources by priority: command line, config file, environment, defaults.
   */
  struct ClientConfig {
    std::string api_endpoint;
    /// Zero means no timeout
    std::chrono::milliseconds timeout{0};
    /// One of e, w, i, d, t
    char log_level{'i'};

    /// Defaults with environment applied
    static ClientConfig defaults();

    /**
     * Override fields present in config file.
     * Keys: "api.endpoint", "api.timeout_ms", "log.level".
     */
    outcome::result<void> merge(const Config &config);
  };

  /**
   * Set process-wide endpoint, http client with timeout and log level
   */
  outcome::result<void> apply(const ClientConfig &config);
}  // namespace mdag::config
