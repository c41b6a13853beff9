/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mdag::object {
  enum class ObjectError {
    kEmptyPath = 1,
    kAbsolutePath,
    kLinkNotFound,
    kSizeMismatch,
    kInvalidHash,
  };
}  // namespace mdag::object

OUTCOME_HPP_DECLARE_ERROR(mdag::object, ObjectError);
