/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/curl_error.hpp"

#include "common/http_requests/request.hpp"

namespace mdag::common {
  namespace {
    struct CurlCategory : std::error_category {
      const char *name() const noexcept override {
        return "curl";
      }
      std::string message(int value) const override {
        return curl_easy_strerror(static_cast<CURLcode>(value));
      }
    };
  }  // namespace

  const std::error_category &curlCategory() {
    static const CurlCategory category;
    return category;
  }
}  // namespace mdag::common

OUTCOME_CPP_DEFINE_CATEGORY(mdag::common, HttpRequestError, e) {
  using mdag::common::HttpRequestError;
  switch (e) {
    case (HttpRequestError::kUnableInit):
      return "HttpRequest: unable to init a request";
    case (HttpRequestError::kMimeFailure):
      return "HttpRequest: unable to build multipart body";
    default:
      return "HttpRequest: unknown error";
  }
}
