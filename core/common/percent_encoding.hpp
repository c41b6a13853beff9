/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

namespace mdag::common {
  /**
   * Percent-encode query component, RFC 3986 unreserved characters are kept
   * @param input - raw component
   * @return encoded component
   */
  std::string percentEncode(std::string_view input);
}  // namespace mdag::common
