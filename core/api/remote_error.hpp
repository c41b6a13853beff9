/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <system_error>

#include "codec/json/coding.hpp"

namespace mdag::api {
  /// Server replies this to pin/rm of an object which is not pinned
  constexpr std::string_view kNotPinned{"not pinned"};
  /// Server replies this when argument is not a valid ipfs path
  constexpr std::string_view kInvalidRefPath{"invalid ipfs ref path"};

  /**
   * Error body of non-2xx response
   */
  struct RemoteError {
    std::string message;
    uint64_t code{};
  };

  JSON_DECODE(RemoteError) {
    codec::json::Get(j, "Message", v.message);
    codec::json::Get(j, "Code", v.code);
  }

  /// Number of recent server messages kept besides the ones above
  constexpr size_t kMaxRemoteMessages{1024};

  const std::error_category &remoteErrorCategory();

  /**
   * Make error code which message is exactly server message.
   * Equal messages produce equal codes while the message is retained.
   * Only the latest kMaxRemoteMessages distinct messages are retained,
   * older codes report a generic message. kNotPinned and kInvalidRefPath
   * are never dropped.
   */
  std::error_code makeRemoteError(std::string_view message);

  /// Check that error was reported by server with given message
  bool isRemoteError(const std::error_code &ec, std::string_view message);
}  // namespace mdag::api
