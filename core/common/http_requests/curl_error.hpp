/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <curl/curl.h>
#include <system_error>

namespace mdag::common {
  /// Category of libcurl easy interface codes, message is curl_easy_strerror
  const std::error_category &curlCategory();

  inline std::error_code makeCurlError(CURLcode code) {
    return {static_cast<int>(code), curlCategory()};
  }
}  // namespace mdag::common
