/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace mdag::codec::multihash {
  enum class MultihashError {
    kInvalidBase58 = 1,
    kInvalidMultihash,
  };

  /**
   * Decode base58 string and check it holds a well-formed multihash
   * @param base58 - hash as shown at the public surface
   * @return raw multihash bytes as sent on the protobuf wire
   */
  outcome::result<Bytes> decode(std::string_view base58);

  /// Check raw bytes hold a well-formed multihash
  outcome::result<void> validate(BytesIn bytes);

  /// Encode raw multihash bytes to base58 string
  std::string encode(const Bytes &bytes);
}  // namespace mdag::codec::multihash

OUTCOME_HPP_DECLARE_ERROR(mdag::codec::multihash, MultihashError);
