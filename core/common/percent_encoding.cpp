/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/percent_encoding.hpp"

#include <cstdint>

namespace mdag::common {
  constexpr std::string_view kUnreserved{
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz"
      "0123456789"
      "-_.~"};
  constexpr std::string_view kHex{"0123456789ABCDEF"};

  inline bool needEncode(char c) {
    return kUnreserved.find(c) == std::string_view::npos;
  }

  std::string percentEncode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (const auto c : input) {
      if (!needEncode(c)) {
        out.push_back(c);
        continue;
      }
      const auto byte{static_cast<uint8_t>(c)};
      out.push_back('%');
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0x0F]);
    }
    return out;
  }
}  // namespace mdag::common
