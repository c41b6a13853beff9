/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include "common/outcome_fmt.hpp"

namespace mdag::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Optional sink shared by every logger, set before loggers are created
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Map a single-letter level name to spdlog level
   * @param level - one of e, w, i, d, t
   * @return level or none if letter is unknown
   */
  std::optional<spdlog::level::level_enum> parseLogLevel(char level);
}  // namespace mdag::common
