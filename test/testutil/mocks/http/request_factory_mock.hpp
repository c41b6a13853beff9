/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_TESTUTIL_MOCKS_HTTP_REQUEST_FACTORY_MOCK_HPP
#define CPP_MERKLEDAG_TESTUTIL_MOCKS_HTTP_REQUEST_FACTORY_MOCK_HPP

#include <gmock/gmock.h>

#include "common/http_requests/request_factory.hpp"

namespace mdag::common {
  class RequestFactoryMock : public RequestFactory {
   public:
    MOCK_METHOD1(newRequest,
                 outcome::result<std::unique_ptr<Request>>(const std::string &));
  };

  class RequestMock : public Request {
   public:
    MOCK_METHOD1(setupUrl, void(const std::string &));
    MOCK_METHOD1(setupMethod, void(ReqMethod));
    MOCK_METHOD1(setupHeader, void(const std::pair<HeaderName, HeaderValue> &));
    MOCK_METHOD2(setupMultipart,
                 outcome::result<void>(const std::string &, BytesIn));
    MOCK_METHOD0(perform, outcome::result<Response>());
  };
}  // namespace mdag::common

#endif  // CPP_MERKLEDAG_TESTUTIL_MOCKS_HTTP_REQUEST_FACTORY_MOCK_HPP
