/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>
#include <system_error>

/**
 * Error codes in logs and command line output.
 * fmt::format("{}", ec);   // "not pinned"
 * fmt::format("{:#}", ec); // "not pinned [IpfsRemoteError 1]"
 * Remote error values are only sequence numbers, so the short form is the
 * message alone.
 */
template <>
struct fmt::formatter<std::error_code, char, void> {
  bool verbose{false};

  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    auto it{ctx.begin()};
    if (it != ctx.end() && *it == '#') {
      verbose = true;
      ++it;
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const std::error_code &ec, FormatContext &ctx) const {
    auto out{fmt::format_to(ctx.out(), "{}", ec.message())};
    if (verbose) {
      out = fmt::format_to(out, " [{} {}]", ec.category().name(), ec.value());
    }
    return out;
  }
};
