/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/stat.hpp"

#include "api/api.hpp"

namespace mdag::object {
  outcome::result<Stat> stat(std::string_view path) {
    return api::get<api::Json<Stat>>("object/stat", {{"arg", std::string{path}}});
  }
}  // namespace mdag::object
