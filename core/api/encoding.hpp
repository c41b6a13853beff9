/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/api_error.hpp"
#include "codec/json/coding.hpp"

/**
 * Response body decoders. Each one names the value of `encoding` query
 * parameter which asks server to reply in the expected format.
 */
namespace mdag::api {
  /// Body is dropped
  struct Ignore {
    using Type = void;
    static constexpr const char *kEncoding{nullptr};

    static outcome::result<void> parse(BytesIn) {
      return outcome::success();
    }
  };

  template <typename T>
  struct Json {
    using Type = T;
    static constexpr const char *kEncoding{"json"};

    static outcome::result<T> parse(BytesIn body) {
      return codec::json::decodeBody<T>(body);
    }
  };

  /// M is generated protobuf message
  template <typename M>
  struct Protobuf {
    using Type = M;
    static constexpr const char *kEncoding{"protobuf"};

    static outcome::result<M> parse(BytesIn body) {
      M message;
      if (!message.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        return ApiError::kInvalidProtobuf;
      }
      return message;
    }
  };
}  // namespace mdag::api
