/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>
#include <string>

#include "common/outcome.hpp"

namespace mdag::object {
  class CommittedObject;

  namespace impl {
    struct ObjectFactory;
  }  // namespace impl

  /**
   * Content-addressed handle of stored object: base58 multihash and
   * cumulative size of referenced sub-dag.
   * Created only from commit, stat or decoded server response.
   */
  class Reference {
   public:
    const std::string &hash() const {
      return hash_;
    }

    /// Cumulative size in bytes
    uint64_t size() const {
      return size_;
    }

    /// Canonical path "/ipfs/<hash>"
    std::string toString() const;

    /**
     * Fetch referenced object
     * @return object or ObjectError::kSizeMismatch if fetched object size
     * differs from this reference size
     */
    outcome::result<CommittedObject> get() const;

    outcome::result<void> pin(bool recursive) const;

    /**
     * Unpin referenced object, unpinning not pinned object succeeds
     */
    outcome::result<void> unpin(bool recursive) const;

    bool operator==(const Reference &other) const {
      return hash_ == other.hash_ && size_ == other.size_;
    }
    bool operator!=(const Reference &other) const {
      return !(*this == other);
    }

   private:
    Reference(std::string hash, uint64_t size);
    friend struct impl::ObjectFactory;

    std::string hash_;
    uint64_t size_;
  };

  std::ostream &operator<<(std::ostream &os, const Reference &reference);
}  // namespace mdag::object
