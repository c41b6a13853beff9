/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_CORE_CONFIG_CONFIG_ERROR_HPP
#define CPP_MERKLEDAG_CORE_CONFIG_CONFIG_ERROR_HPP

#include "common/outcome.hpp"

namespace mdag::config {

  /**
   * @brief Config returns these types of errors
   */
  enum class ConfigError {
    kJSONParserError = 1,
    kBadPath,
    kCannotOpenFile,
    kBadValue,
  };

}  // namespace mdag::config

OUTCOME_HPP_DECLARE_ERROR(mdag::config, ConfigError);

#endif  // CPP_MERKLEDAG_CORE_CONFIG_CONFIG_ERROR_HPP
