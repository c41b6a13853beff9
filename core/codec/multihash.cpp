/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/multihash.hpp"

#include <libp2p/multi/multibase_codec/codecs/base58.hpp>
#include <libp2p/multi/multihash.hpp>

namespace mdag::codec::multihash {
  using libp2p::multi::Multihash;

  outcome::result<Bytes> decode(std::string_view base58) {
    auto bytes{libp2p::multi::detail::decodeBase58(base58)};
    if (!bytes) {
      return MultihashError::kInvalidBase58;
    }
    Bytes raw{bytes.value().begin(), bytes.value().end()};
    OUTCOME_TRY(validate(raw));
    return raw;
  }

  outcome::result<void> validate(BytesIn bytes) {
    if (!Multihash::createFromBytes(bytes)) {
      return MultihashError::kInvalidMultihash;
    }
    return outcome::success();
  }

  std::string encode(const Bytes &bytes) {
    return libp2p::multi::detail::encodeBase58(bytes);
  }
}  // namespace mdag::codec::multihash

OUTCOME_CPP_DEFINE_CATEGORY(mdag::codec::multihash, MultihashError, e) {
  using E = mdag::codec::multihash::MultihashError;
  switch (e) {
    case E::kInvalidBase58:
      return "invalid base58 string";
    case E::kInvalidMultihash:
      return "bytes are not a multihash";
  }
  return "unknown MultihashError code";
}
