/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mdag::api {

  /**
   * @brief Errors of the http api facade itself
   */
  enum class ApiError {
    kInvalidEndpoint = 1,
    kInvalidProtobuf,
  };

}  // namespace mdag::api

OUTCOME_HPP_DECLARE_ERROR(mdag::api, ApiError);
