/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP
#define CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP

#include "common/http_requests/request.hpp"

#include <chrono>
#include <curl/curl.h>

namespace mdag::common {

  class RequestFactoryImpl;

  class RequestImpl : public Request {
   public:
    ~RequestImpl() override;

    void setupUrl(const std::string &url) override;

    void setupMethod(ReqMethod method) override;

    void setupHeader(
        const std::pair<std::string, std::string> &header) override;

    outcome::result<void> setupMultipart(const std::string &name,
                                         BytesIn data) override;

    outcome::result<Response> perform() override;

   private:
    explicit RequestImpl(std::chrono::milliseconds timeout);
    friend class RequestFactoryImpl;

    static std::size_t writeBody(char *ptr,
                                 std::size_t size,
                                 std::size_t nmemb,
                                 void *userdata);

    struct curl_slist *headers_;
    curl_mime *mime_;
    ReqMethod method_;
    CURL *curl_;
  };

}  // namespace mdag::common

#endif  // CPP_MERKLEDAG_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP
