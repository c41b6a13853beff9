/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/coding.hpp"

#include <gtest/gtest.h>

#include "common/span.hpp"
#include "testutil/outcome.hpp"

using mdag::codec::json::decode;
using mdag::codec::json::decodeBody;
using mdag::codec::json::JsonError;
using mdag::common::span::cbytes;

namespace {
  struct Entry {
    std::string name;
    uint64_t size{};
  };

  JSON_DECODE(Entry) {
    mdag::codec::json::Get(j, "Name", v.name);
    mdag::codec::json::Get(j, "Size", v.size);
  }

  template <typename T>
  auto decodeStr(std::string_view json) {
    return decodeBody<T>(cbytes(json));
  }
}  // namespace

/**
 * @given malformed json text
 * @when parse it
 * @then parse error returned
 */
TEST(JsonTest, ParseError) {
  EXPECT_OUTCOME_ERROR(JsonError::kParseError,
                       mdag::codec::json::parse(std::string_view{"{\"a\":"}));
  EXPECT_OUTCOME_ERROR(JsonError::kParseError, decodeStr<Entry>(""));
}

/**
 * @given object with all keys
 * @when decode struct
 * @then fields are filled
 */
TEST(JsonTest, DecodeStruct) {
  EXPECT_OUTCOME_TRUE(entry,
                      decodeStr<Entry>(R"({"Name":"a","Size":3,"Extra":1})"));
  EXPECT_EQ(entry.name, "a");
  EXPECT_EQ(entry.size, 3);
}

/**
 * @given objects with missing key and wrong value type
 * @when decode struct
 * @then out of range and wrong type errors returned
 */
TEST(JsonTest, DecodeStructErrors) {
  EXPECT_OUTCOME_ERROR(JsonError::kOutOfRange,
                       decodeStr<Entry>(R"({"Name":"a"})"));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType,
                       decodeStr<Entry>(R"({"Name":1,"Size":3})"));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<Entry>("[]"));
}

/**
 * @given numbers as json numbers and decimal strings
 * @when decode uint64
 * @then both forms accepted, garbage rejected
 */
TEST(JsonTest, Uint64) {
  EXPECT_OUTCOME_TRUE(number, decodeStr<uint64_t>("18446744073709551615"));
  EXPECT_EQ(number, UINT64_MAX);
  EXPECT_OUTCOME_TRUE(str, decodeStr<uint64_t>("\"42\""));
  EXPECT_EQ(str, 42);
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<uint64_t>("\"42x\""));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<uint64_t>("\"\""));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<uint64_t>("-1"));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<uint64_t>("\"-1\""));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, decodeStr<uint64_t>("\" 1\""));
  EXPECT_OUTCOME_ERROR(JsonError::kOutOfRange,
                       decodeStr<uint64_t>("\"18446744073709551616\""));
}

/**
 * @given number above uint32 range
 * @when decode uint32
 * @then out of range error returned
 */
TEST(JsonTest, Uint32Range) {
  EXPECT_OUTCOME_TRUE(max, decodeStr<uint32_t>("4294967295"));
  EXPECT_EQ(max, UINT32_MAX);
  EXPECT_OUTCOME_ERROR(JsonError::kOutOfRange,
                       decodeStr<uint32_t>("4294967296"));
}
