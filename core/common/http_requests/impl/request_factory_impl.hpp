/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_REQUEST_FACTORY_IMPL_HPP
#define CPP_MERKLEDAG_REQUEST_FACTORY_IMPL_HPP

#include <chrono>

#include "common/http_requests/request_factory.hpp"

namespace mdag::common {
  /**
   * Creates libcurl easy requests, one handle per request
   */
  class RequestFactoryImpl : public RequestFactory {
   public:
    /// @param timeout - whole transfer timeout, zero means no timeout
    explicit RequestFactoryImpl(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) override;

   private:
    std::chrono::milliseconds timeout_;
  };
}  // namespace mdag::common

#endif  // CPP_MERKLEDAG_REQUEST_FACTORY_IMPL_HPP
