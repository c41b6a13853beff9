/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/api_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mdag::api, ApiError, e) {
  using E = mdag::api::ApiError;
  switch (e) {
    case E::kInvalidEndpoint:
      return "ApiError: endpoint must be an http or https url";
    case E::kInvalidProtobuf:
      return "ApiError: cannot decode protobuf response";
  }
  return "ApiError: unknown error";
}
