/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/json/coding.hpp"

namespace mdag::object {
  /**
   * Object metadata
   */
  struct Stat {
    std::string hash;
    uint64_t num_links{};
    /// Bytes in object data
    uint64_t data_size{};
    /// Total dag size
    uint64_t cumulative_size{};

    bool operator==(const Stat &other) const {
      return hash == other.hash && num_links == other.num_links
             && data_size == other.data_size
             && cumulative_size == other.cumulative_size;
    }
  };

  JSON_DECODE(Stat) {
    codec::json::Get(j, "Hash", v.hash);
    codec::json::Get(j, "NumLinks", v.num_links);
    codec::json::Get(j, "DataSize", v.data_size);
    codec::json::Get(j, "CumulativeSize", v.cumulative_size);
  }

  /**
   * Query object metadata without downloading object
   * @param path - ipfs or ipns path
   */
  outcome::result<Stat> stat(std::string_view path);
}  // namespace mdag::object
