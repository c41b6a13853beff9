/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/object_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mdag::object, ObjectError, e) {
  using mdag::object::ObjectError;
  switch (e) {
    case ObjectError::kEmptyPath:
      return "cannot resolve empty path";
    case ObjectError::kAbsolutePath:
      return "expected relative path";
    case ObjectError::kLinkNotFound:
      return "path lookup failed";
    case ObjectError::kSizeMismatch:
      return "reference and referenced object sizes do not match";
    case ObjectError::kInvalidHash:
      return "hash is not a base58 encoded multihash";
  }
  return "unknown ObjectError code";
}
