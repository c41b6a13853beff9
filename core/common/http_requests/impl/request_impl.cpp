/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/impl/request_impl.hpp"

#include "common/http_requests/curl_error.hpp"

namespace mdag::common {
  std::size_t RequestImpl::writeBody(char *ptr,
                                     std::size_t size,
                                     std::size_t nmemb,
                                     void *userdata) {
    auto &body{*static_cast<Bytes *>(userdata)};
    const auto n{size * nmemb};
    body.insert(body.end(), ptr, ptr + n);
    return n;
  }

  void RequestImpl::setupUrl(const std::string &url) {
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  }

  void RequestImpl::setupMethod(ReqMethod method) {
    method_ = method;
    switch (method) {
      case ReqMethod::GET:
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        return;
      case ReqMethod::POST:
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        return;
    }
  }

  void RequestImpl::setupHeader(
      const std::pair<std::string, std::string> &header) {
    headers_ = curl_slist_append(headers_,
                                 (header.first + ": " + header.second).c_str());
  }

  outcome::result<void> RequestImpl::setupMultipart(const std::string &name,
                                                    BytesIn data) {
    if (!mime_) {
      mime_ = curl_mime_init(curl_);
      if (!mime_) {
        return HttpRequestError::kMimeFailure;
      }
    }
    auto part{curl_mime_addpart(mime_)};
    if (!part) {
      return HttpRequestError::kMimeFailure;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *chars{reinterpret_cast<const char *>(data.data())};
    if (curl_mime_name(part, name.c_str()) != CURLE_OK
        || curl_mime_data(part, chars, data.size()) != CURLE_OK
        || curl_mime_type(part, "application/octet-stream") != CURLE_OK) {
      return HttpRequestError::kMimeFailure;
    }
    return outcome::success();
  }

  outcome::result<Response> RequestImpl::perform() {
    Response res;

    if (headers_) {
      curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }
    if (mime_) {
      curl_easy_setopt(curl_, CURLOPT_MIMEPOST, mime_);
    } else if (method_ == ReqMethod::POST) {
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, "");
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, 0L);
    }
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &RequestImpl::writeBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &res.body);

    const auto code{curl_easy_perform(curl_)};
    if (code != CURLE_OK) {
      return makeCurlError(code);
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &res.status_code);

    return res;
  }

  RequestImpl::~RequestImpl() {
    if (curl_) {
      curl_easy_cleanup(curl_);
    }

    if (mime_) {
      curl_mime_free(mime_);
    }

    if (headers_) {
      curl_slist_free_all(headers_);
    }
  }

  RequestImpl::RequestImpl(std::chrono::milliseconds timeout)
      : headers_(nullptr),
        mime_(nullptr),
        method_(ReqMethod::GET),
        curl_(curl_easy_init()) {
    if (curl_) {
      curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

      // Follow HTTP redirects if necessary
      curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);

      if (timeout.count() > 0) {
        curl_easy_setopt(
            curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
      }
    }
  }

}  // namespace mdag::common
