/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "common/bytes.hpp"
#include "object/link.hpp"

namespace mdag::object {
  struct CommitError;

  /**
   * Mutable dag node, not yet stored.
   * Links point to committed objects only.
   */
  struct Object {
    Object() = default;
    Object(Bytes data, std::vector<Link> links)
        : data{std::move(data)}, links{std::move(links)} {}

    /// Cumulative size: data length plus sizes of linked objects
    uint64_t size() const;

    /**
     * Resolve relative path across links.
     * First path segment selects first link with that name, rest of path is
     * resolved by server starting from linked object.
     * @param path - relative path, e.g. "a/b/c"
     * @return linked object or descendant
     */
    outcome::result<CommittedObject> get(std::string_view path) const;

    /**
     * Store object, links order and data bytes are kept verbatim
     * @return committed object or error together with this object
     */
    outcome::result<CommittedObject, CommitError> commit() &&;

    bool operator==(const Object &other) const {
      return data == other.data && links == other.links;
    }
    bool operator!=(const Object &other) const {
      return !(*this == other);
    }

    Bytes data;
    std::vector<Link> links;
  };

  /**
   * Commit failure, returns draft back to caller
   */
  struct CommitError {
    std::error_code error;
    Object object;
  };

  inline std::error_code make_error_code(const CommitError &e) {
    return e.error;
  }

  [[noreturn]] inline void outcome_throw_as_system_error_with_payload(
      const CommitError &e) {
    outcome::raise(e.error);
  }

  /**
   * Fetch object by ipfs or ipns path, following names recursively
   * @param path - "/ipfs/<hash>/...", "/ipns/<name>/..." or bare hash
   */
  outcome::result<CommittedObject> get(std::string_view path);
}  // namespace mdag::object
