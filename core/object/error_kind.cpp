/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/error_kind.hpp"

#include "api/api_error.hpp"
#include "codec/json/json_errors.hpp"
#include "codec/multihash.hpp"
#include "common/http_requests/curl_error.hpp"
#include "object/object_error.hpp"

namespace mdag::object {
  namespace {
    template <typename E>
    bool isCategory(const std::error_code &ec, E e) {
      return ec.category() == make_error_code(e).category();
    }
  }  // namespace

  ErrorKind errorKind(const std::error_code &ec) {
    using api::ApiError;
    if (ec.category() == common::curlCategory()
        || ec.category() == std::system_category()
        || ec.category() == std::generic_category()
        || isCategory(ec, common::HttpRequestError::kUnableInit)) {
      return ErrorKind::kIo;
    }
    if (isCategory(ec, codec::json::JsonError::kParseError)
        || isCategory(ec, codec::multihash::MultihashError::kInvalidBase58)
        || ec == ApiError::kInvalidProtobuf) {
      return ErrorKind::kInvalidData;
    }
    if (ec == ApiError::kInvalidEndpoint) {
      return ErrorKind::kInvalidInput;
    }
    if (isCategory(ec, ObjectError::kEmptyPath)) {
      switch (static_cast<ObjectError>(ec.value())) {
        case ObjectError::kEmptyPath:
        case ObjectError::kAbsolutePath:
          return ErrorKind::kInvalidInput;
        case ObjectError::kLinkNotFound:
          return ErrorKind::kNotFound;
        case ObjectError::kSizeMismatch:
        case ObjectError::kInvalidHash:
          return ErrorKind::kInvalidData;
      }
    }
    return ErrorKind::kOther;
  }

  const char *errorKindName(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::kIo:
        return "io";
      case ErrorKind::kInvalidData:
        return "invalid data";
      case ErrorKind::kInvalidInput:
        return "invalid input";
      case ErrorKind::kNotFound:
        return "not found";
      case ErrorKind::kOther:
        return "other";
    }
    return "unknown";
  }
}  // namespace mdag::object
