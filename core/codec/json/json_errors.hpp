/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mdag::codec::json {
  enum class JsonError {
    kParseError = 1,
    kWrongType,
    kOutOfRange,
  };
}  // namespace mdag::codec::json

OUTCOME_HPP_DECLARE_ERROR(mdag::codec::json, JsonError);
