/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "object/committed_object.hpp"

namespace mdag::object::impl {
  /**
   * The only place where references and committed objects are constructed
   */
  struct ObjectFactory {
    static Reference makeReference(std::string hash, uint64_t size) {
      return Reference{std::move(hash), size};
    }

    static CommittedObject makeCommitted(Reference reference, Object object) {
      return CommittedObject{std::move(reference), std::move(object)};
    }
  };
}  // namespace mdag::object::impl
