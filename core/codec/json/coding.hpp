/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <limits>
#include <string>

#include "codec/json/json.hpp"

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const ::mdag::codec::json::Value &j)

namespace mdag::codec::json {
  template <typename T>
  T innerDecode(const Value &j);

  template <typename T>
  inline T kDefaultT() {
    return {};
  }

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  /// Numbers are sent either as json numbers or as decimal strings
  JSON_DECODE(uint64_t) {
    if (j.IsUint64()) {
      v = j.GetUint64();
    } else if (j.IsString() && j.GetStringLength() != 0) {
      const auto end{j.GetString() + j.GetStringLength()};
      const auto [ptr, ec]{std::from_chars(j.GetString(), end, v)};
      if (ec == std::errc::result_out_of_range) {
        outcome::raise(JsonError::kOutOfRange);
      }
      if (ec != std::errc{} || ptr != end) {
        outcome::raise(JsonError::kWrongType);
      }
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_DECODE(uint32_t) {
    uint64_t v64{};
    decode(v64, j);
    if (v64 > std::numeric_limits<uint32_t>::max()) {
      outcome::raise(JsonError::kOutOfRange);
    }
    v = static_cast<uint32_t>(v64);
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  inline const Value &Get(const Value &j, const char *key) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    auto it = j.FindMember(key);
    if (it == j.MemberEnd()) {
      outcome::raise(JsonError::kOutOfRange);
    }
    return it->value;
  }

  template <typename T>
  inline void Get(const Value &j, const char *key, T &v) {
    decode(v, Get(j, key));
  }

  template <typename T>
  inline T innerDecode(const Value &j) {
    T v{kDefaultT<T>()};
    decode(v, j);
    return v;
  }

  template <typename T>
  inline outcome::result<T> decode(const Value &j) {
    if constexpr (std::is_void_v<T>) {
      return outcome::success();
    } else {
      try {
        return innerDecode<T>(j);
      } catch (std::system_error &e) {
        return outcome::failure(e.code());
      }
    }
  }

  template <typename T>
  inline outcome::result<T> decodeBody(BytesIn input) {
    OUTCOME_TRY(document, parse(input));
    return decode<T>(document);
  }
}  // namespace mdag::codec::json
