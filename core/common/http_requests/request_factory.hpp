/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_REQUEST_FACTORY_HPP
#define CPP_MERKLEDAG_REQUEST_FACTORY_HPP

#include <memory>
#include <string>

#include "common/http_requests/request.hpp"

namespace mdag::common {
  class RequestFactory {
   public:
    virtual ~RequestFactory() = default;

    virtual outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) = 0;
  };
}  // namespace mdag::common

#endif  // CPP_MERKLEDAG_REQUEST_FACTORY_HPP
