/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "object/object.hpp"
#include "object/stat.hpp"

namespace mdag::object {
  /**
   * Stored object bound to its reference, read-only
   */
  class CommittedObject {
   public:
    const Object &operator*() const {
      return object_;
    }
    const Object *operator->() const {
      return &object_;
    }

    const Bytes &data() const {
      return object_.data;
    }
    const std::vector<Link> &links() const {
      return object_.links;
    }

    const std::string &hash() const {
      return reference_.hash();
    }
    uint64_t size() const {
      return reference_.size();
    }

    const Reference &reference() const & {
      return reference_;
    }
    Reference intoReference() && {
      return std::move(reference_);
    }

    /// Drop reference and return mutable object
    Object edit() && {
      return std::move(object_);
    }

    /// Stat computed locally
    Stat stat() const;

    outcome::result<void> pin(bool recursive) const {
      return reference_.pin(recursive);
    }
    outcome::result<void> unpin(bool recursive) const {
      return reference_.unpin(recursive);
    }

    outcome::result<CommittedObject> get(std::string_view path) const {
      return object_.get(path);
    }

    /// Same reference
    bool operator==(const CommittedObject &other) const {
      return reference_ == other.reference_;
    }
    bool operator!=(const CommittedObject &other) const {
      return !(*this == other);
    }

    /// Same data and links
    bool operator==(const Object &other) const {
      return object_ == other;
    }
    bool operator!=(const Object &other) const {
      return !(*this == other);
    }

   private:
    CommittedObject(Reference reference, Object object)
        : reference_{std::move(reference)}, object_{std::move(object)} {}
    friend struct impl::ObjectFactory;

    Reference reference_;
    Object object_;
  };
}  // namespace mdag::object
