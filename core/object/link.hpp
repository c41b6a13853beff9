/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "object/reference.hpp"

namespace mdag::object {
  /**
   * Named edge to committed object, names are advisory and may repeat
   */
  struct Link {
    std::string name;
    Reference object;

    bool operator==(const Link &other) const {
      return name == other.name && object == other.object;
    }
    bool operator!=(const Link &other) const {
      return !(*this == other);
    }
  };
}  // namespace mdag::object
