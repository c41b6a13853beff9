/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/http/fake_request_factory.hpp"

#include <fmt/format.h>

namespace testutil::http {
  using mdag::outcome::result;
  using mdag::common::Request;
  using mdag::common::Response;

  std::string SentRequest::header(const std::string &name) const {
    for (const auto &[key, value] : headers) {
      if (key == name) {
        return value;
      }
    }
    return {};
  }

  class FakeRequest : public Request {
   public:
    FakeRequest(FakeRequestFactory &factory, std::string url)
        : factory_{factory} {
      request_.url = std::move(url);
    }

    void setupUrl(const std::string &url) override {
      request_.url = url;
    }

    void setupMethod(ReqMethod method) override {
      request_.method = method;
    }

    void setupHeader(
        const std::pair<std::string, std::string> &header) override {
      request_.headers.emplace_back(header);
    }

    result<void> setupMultipart(const std::string &name,
                                mdag::BytesIn data) override {
      request_.part_name = name;
      request_.part = mdag::copy(data);
      return mdag::outcome::success();
    }

    result<Response> perform() override {
      return factory_.perform(request_);
    }

   private:
    FakeRequestFactory &factory_;
    SentRequest request_;
  };

  void FakeRequestFactory::reply(long status, std::string_view body) {
    std::lock_guard lock{mutex_};
    replies_.push_back({status, Bytes{body.begin(), body.end()}, {}});
  }

  void FakeRequestFactory::replyOk(std::string_view body) {
    reply(200, body);
  }

  void FakeRequestFactory::replyOk(const Bytes &body) {
    std::lock_guard lock{mutex_};
    replies_.push_back({200, body, {}});
  }

  void FakeRequestFactory::replyError(std::string_view message,
                                      uint64_t code) {
    reply(500,
          fmt::format(R"({{"Message":"{}","Code":{},"Type":"error"}})",
                      message,
                      code));
  }

  void FakeRequestFactory::fail(std::error_code error) {
    std::lock_guard lock{mutex_};
    replies_.push_back({0, {}, error});
  }

  result<std::unique_ptr<Request>> FakeRequestFactory::newRequest(
      const std::string &url) {
    return std::make_unique<FakeRequest>(*this, url);
  }

  std::vector<SentRequest> FakeRequestFactory::sent() const {
    std::lock_guard lock{mutex_};
    return sent_;
  }

  size_t FakeRequestFactory::pending() const {
    std::lock_guard lock{mutex_};
    return replies_.size();
  }

  result<Response> FakeRequestFactory::perform(SentRequest request) {
    std::lock_guard lock{mutex_};
    sent_.push_back(std::move(request));
    if (replies_.empty()) {
      return std::make_error_code(std::errc::connection_refused);
    }
    auto reply{std::move(replies_.front())};
    replies_.pop_front();
    if (reply.error) {
      return reply.error;
    }
    Response response;
    response.status_code = reply.status;
    response.body = std::move(reply.body);
    return response;
  }
}  // namespace testutil::http
