/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/reference.hpp"

#include <cassert>

#include "api/api.hpp"
#include "api/remote_error.hpp"
#include "common/logger.hpp"
#include "object/committed_object.hpp"
#include "object/object_error.hpp"

namespace mdag::object {
  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("object")};
      return logger;
    }
  }  // namespace

  Reference::Reference(std::string hash, uint64_t size)
      : hash_{std::move(hash)}, size_{size} {}

  std::string Reference::toString() const {
    return "/ipfs/" + hash_;
  }

  outcome::result<CommittedObject> Reference::get() const {
    OUTCOME_TRY(object, object::get(hash_));
    if (object.size() != size_) {
      logger()->warn("size of {} is {}, reference size is {}",
                     hash_,
                     object.size(),
                     size_);
      return ObjectError::kSizeMismatch;
    }
    return std::move(object);
  }

  outcome::result<void> Reference::pin(bool recursive) const {
    logger()->debug("pin {}", hash_);
    return api::post<api::Ignore>(
        "pin/add", {{"recursive", api::boolToStr(recursive)}, {"arg", hash_}});
  }

  outcome::result<void> Reference::unpin(bool recursive) const {
    logger()->debug("unpin {}", hash_);
    auto res{api::post<api::Ignore>(
        "pin/rm", {{"recursive", api::boolToStr(recursive)}, {"arg", hash_}})};
    if (!res) {
      if (api::isRemoteError(res.error(), api::kNotPinned)) {
        return outcome::success();
      }
      assert(!api::isRemoteError(res.error(), api::kInvalidRefPath)
             && "reference hash is valid by construction");
      return res.error();
    }
    return outcome::success();
  }

  std::ostream &operator<<(std::ostream &os, const Reference &reference) {
    return os << reference.toString();
  }
}  // namespace mdag::object
