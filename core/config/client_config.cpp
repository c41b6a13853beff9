/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/client_config.hpp"

#include <cstdlib>

#include "api/api.hpp"
#include "common/http_requests/impl/request_factory_impl.hpp"
#include "common/logger.hpp"

namespace mdag::config {
  namespace {
    /// Missing key keeps current value
    template <typename T>
    outcome::result<bool> getOptional(const Config &config,
                                      const ConfigKey &key,
                                      T &value) {
      auto res{config.get<T>(key)};
      if (!res) {
        if (res.error() == ConfigError::kBadPath) {
          return false;
        }
        return res.error();
      }
      value = std::move(res.value());
      return true;
    }
  }  // namespace

  ClientConfig ClientConfig::defaults() {
    ClientConfig config;
    config.api_endpoint = api::kDefaultApiEndpoint;
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (const auto *env{std::getenv(kApiEnv)}; env && *env) {
      config.api_endpoint = env;
    }
    return config;
  }

  outcome::result<void> ClientConfig::merge(const Config &config) {
    OUTCOME_TRY(getOptional(config, "api.endpoint", api_endpoint));
    int64_t timeout_ms{timeout.count()};
    OUTCOME_TRY(has_timeout, getOptional(config, "api.timeout_ms", timeout_ms));
    if (has_timeout) {
      if (timeout_ms < 0) {
        return ConfigError::kBadValue;
      }
      timeout = std::chrono::milliseconds{timeout_ms};
    }
    std::string level;
    OUTCOME_TRY(has_level, getOptional(config, "log.level", level));
    if (has_level) {
      if (level.size() != 1 || !common::parseLogLevel(level[0])) {
        return ConfigError::kBadValue;
      }
      log_level = level[0];
    }
    return outcome::success();
  }

  outcome::result<void> apply(const ClientConfig &config) {
    const auto level{common::parseLogLevel(config.log_level)};
    if (!level) {
      return ConfigError::kBadValue;
    }
    OUTCOME_TRY(api::setApiEndpoint(config.api_endpoint));
    api::setRequestFactory(
        std::make_shared<common::RequestFactoryImpl>(config.timeout));
    spdlog::set_level(*level);
    common::createLogger("config")->info("api endpoint {}",
                                         api::getApiEndpoint());
    return outcome::success();
  }
}  // namespace mdag::config
