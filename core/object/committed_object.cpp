/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/committed_object.hpp"

namespace mdag::object {
  Stat CommittedObject::stat() const {
    return {hash(), object_.links.size(), object_.data.size(), size()};
  }
}  // namespace mdag::object
