/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include "codec/json/json_errors.hpp"
#include "common/bytes.hpp"

namespace mdag::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);
}  // namespace mdag::codec::json
