/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/reader.h>

#include "common/span.hpp"

namespace mdag::codec::json {
  using rapidjson::ParseFlag;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse<ParseFlag::kParseValidateEncodingFlag>(input.data(),
                                                     input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    return parse(common::span::bytestr(input));
  }
}  // namespace mdag::codec::json
