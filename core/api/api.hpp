/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/encoding.hpp"
#include "common/http_requests/request_factory.hpp"

namespace mdag::api {
  using common::RequestFactory;

  /// Ordered query pairs, names may repeat
  using Query = std::vector<std::pair<std::string, std::string>>;

  constexpr auto kDefaultApiEndpoint{"http://127.0.0.1:5001/api/v0/"};

  /**
   * Replace process-wide api endpoint
   * @param url - http or https url, trailing slash is appended if missing
   */
  outcome::result<void> setApiEndpoint(const std::string &url);

  std::string getApiEndpoint();

  /// Replace process-wide http client, used by every following request
  void setRequestFactory(std::shared_ptr<RequestFactory> factory);

  std::shared_ptr<RequestFactory> getRequestFactory();

  inline const char *boolToStr(bool value) {
    return value ? "true" : "false";
  }

  /**
   * Build request url, `encoding` goes first when not null
   */
  std::string makeUrl(std::string_view endpoint,
                      std::string_view path,
                      const Query &query,
                      const char *encoding);

  /**
   * Perform request against current endpoint
   * @param method - GET or POST
   * @param path - api path relative to endpoint
   * @param query - query pairs
   * @param encoding - expected response encoding or null
   * @param data - body sent as multipart part "data"
   * @return response body of 2xx reply, otherwise server error
   */
  outcome::result<Bytes> request(common::ReqMethod method,
                                 std::string_view path,
                                 const Query &query,
                                 const char *encoding,
                                 boost::optional<BytesIn> data);

  template <typename Codec>
  outcome::result<typename Codec::Type> get(std::string_view path,
                                            const Query &query = {}) {
    OUTCOME_TRY(
        body,
        request(common::ReqMethod::GET, path, query, Codec::kEncoding, {}));
    return Codec::parse(body);
  }

  template <typename Codec>
  outcome::result<typename Codec::Type> post(std::string_view path,
                                             const Query &query = {}) {
    OUTCOME_TRY(
        body,
        request(common::ReqMethod::POST, path, query, Codec::kEncoding, {}));
    return Codec::parse(body);
  }

  template <typename Codec>
  outcome::result<typename Codec::Type> postData(std::string_view path,
                                                 const Query &query,
                                                 BytesIn data) {
    OUTCOME_TRY(body,
                request(common::ReqMethod::POST,
                        path,
                        query,
                        Codec::kEncoding,
                        data));
    return Codec::parse(body);
  }
}  // namespace mdag::api
