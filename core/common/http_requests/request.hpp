/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP
#define CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP

#include <string>
#include <utility>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace mdag::common {

  using HeaderName = std::string;
  using HeaderValue = std::string;

  enum ReqMethod {
    GET,
    POST,
  };

  struct Response {
    long status_code{};
    Bytes body;
  };

  /**
   * Single http request, configured by setters and executed once by perform
   */
  class Request {
   public:
    virtual ~Request() = default;

    virtual void setupUrl(const std::string &url) = 0;

    virtual void setupMethod(ReqMethod method) = 0;

    virtual void setupHeader(
        const std::pair<HeaderName, HeaderValue> &header) = 0;

    /**
     * Attach multipart/form-data part to request body
     * @param name - form field name
     * @param data - part content, copied
     */
    virtual outcome::result<void> setupMultipart(const std::string &name,
                                                 BytesIn data) = 0;

    /**
     * Execute request and buffer whole response body
     * @return response or transport error
     */
    virtual outcome::result<Response> perform() = 0;
  };

  enum class HttpRequestError {
    kUnableInit = 1,
    kMimeFailure,
  };

}  // namespace mdag::common

OUTCOME_HPP_DECLARE_ERROR(mdag::common, HttpRequestError);

#endif  // CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP
