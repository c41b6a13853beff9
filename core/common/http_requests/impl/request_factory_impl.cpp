/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/impl/request_factory_impl.hpp"

#include "common/http_requests/curl_error.hpp"
#include "common/http_requests/impl/request_impl.hpp"

namespace mdag::common {
  namespace {
    CURLcode globalInit() {
      static const CURLcode code{curl_global_init(CURL_GLOBAL_DEFAULT)};
      return code;
    }
  }  // namespace

  RequestFactoryImpl::RequestFactoryImpl(std::chrono::milliseconds timeout)
      : timeout_{timeout} {}

  outcome::result<std::unique_ptr<Request>> RequestFactoryImpl::newRequest(
      const std::string &url) {
    const auto init{globalInit()};
    if (init != CURLE_OK) {
      return makeCurlError(init);
    }

    struct make_unique_enabler : public RequestImpl {
      explicit make_unique_enabler(std::chrono::milliseconds timeout)
          : RequestImpl{timeout} {};
    };

    std::unique_ptr<RequestImpl> request =
        std::make_unique<make_unique_enabler>(timeout_);

    if (!request->curl_) {
      return HttpRequestError::kUnableInit;
    }

    request->setupUrl(url);

    return outcome::success(std::move(request));
  }
}  // namespace mdag::common
