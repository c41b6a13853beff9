/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/api.hpp"

#include <shared_mutex>

#include "api/remote_error.hpp"
#include "common/http_requests/impl/request_factory_impl.hpp"
#include "common/logger.hpp"
#include "common/percent_encoding.hpp"

namespace mdag::api {
  using common::ReqMethod;

  namespace {
    struct Client {
      std::shared_mutex mutex;
      std::string endpoint{kDefaultApiEndpoint};
      std::shared_ptr<RequestFactory> factory{
          std::make_shared<common::RequestFactoryImpl>()};
    };

    Client &client() {
      static Client client;
      return client;
    }

    common::Logger logger() {
      static common::Logger logger{common::createLogger("api")};
      return logger;
    }

    const char *methodName(ReqMethod method) {
      switch (method) {
        case ReqMethod::GET:
          return "GET";
        case ReqMethod::POST:
          return "POST";
      }
      return "?";
    }

    bool startsWith(std::string_view s, std::string_view prefix) {
      return s.substr(0, prefix.size()) == prefix;
    }
  }  // namespace

  outcome::result<void> setApiEndpoint(const std::string &url) {
    std::string_view scheme;
    if (startsWith(url, "http://")) {
      scheme = "http://";
    } else if (startsWith(url, "https://")) {
      scheme = "https://";
    } else {
      return ApiError::kInvalidEndpoint;
    }
    if (url.size() == scheme.size() || url[scheme.size()] == '/') {
      return ApiError::kInvalidEndpoint;
    }
    auto endpoint{url};
    if (endpoint.back() != '/') {
      endpoint.push_back('/');
    }
    auto &c{client()};
    std::unique_lock lock{c.mutex};
    c.endpoint = std::move(endpoint);
    return outcome::success();
  }

  std::string getApiEndpoint() {
    auto &c{client()};
    std::shared_lock lock{c.mutex};
    return c.endpoint;
  }

  void setRequestFactory(std::shared_ptr<RequestFactory> factory) {
    auto &c{client()};
    std::unique_lock lock{c.mutex};
    c.factory = std::move(factory);
  }

  std::shared_ptr<RequestFactory> getRequestFactory() {
    auto &c{client()};
    std::shared_lock lock{c.mutex};
    return c.factory;
  }

  std::string makeUrl(std::string_view endpoint,
                      std::string_view path,
                      const Query &query,
                      const char *encoding) {
    std::string url;
    url.append(endpoint);
    url.append(path);
    auto separator{'?'};
    const auto param{[&](std::string_view name, std::string_view value) {
      url.push_back(separator);
      separator = '&';
      url.append(common::percentEncode(name));
      url.push_back('=');
      url.append(common::percentEncode(value));
    }};
    if (encoding) {
      param("encoding", encoding);
    }
    for (const auto &[name, value] : query) {
      param(name, value);
    }
    return url;
  }

  outcome::result<Bytes> request(ReqMethod method,
                                 std::string_view path,
                                 const Query &query,
                                 const char *encoding,
                                 boost::optional<BytesIn> data) {
    std::string endpoint;
    std::shared_ptr<RequestFactory> factory;
    {
      auto &c{client()};
      std::shared_lock lock{c.mutex};
      endpoint = c.endpoint;
      factory = c.factory;
    }

    const auto url{makeUrl(endpoint, path, query, encoding)};
    logger()->debug("{} {}", methodName(method), url);

    OUTCOME_TRY(req, factory->newRequest(url));
    req->setupMethod(method);
    if (data) {
      req->setupHeader({"Connection", "close"});
      OUTCOME_TRY(req->setupMultipart("data", *data));
    }
    auto performed{req->perform()};
    if (!performed) {
      logger()->warn(
          "{} {} failed: {:#}", methodName(method), url, performed.error());
      return performed.error();
    }
    auto &res{performed.value()};

    if (res.status_code >= 200 && res.status_code < 300) {
      return std::move(res.body);
    }
    auto remote{codec::json::decodeBody<RemoteError>(res.body)};
    if (!remote) {
      logger()->warn("API error: status {} with undecodable body",
                     res.status_code);
      return remote.error();
    }
    logger()->warn(
        "API error: {} {}", remote.value().code, remote.value().message);
    return makeRemoteError(remote.value().message);
  }
}  // namespace mdag::api
