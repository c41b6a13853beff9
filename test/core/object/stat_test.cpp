/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/stat.hpp"

#include <gtest/gtest.h>

#include "testutil/api/fake_api_test.hpp"
#include "testutil/api/ipfs_replies.hpp"
#include "testutil/outcome.hpp"

using mdag::codec::json::JsonError;
using mdag::object::Stat;
using testutil::api::kHashA;

class StatTest : public test::FakeApiTest {};

/**
 * @given object/stat reply
 * @when stat path
 * @then reply fields are decoded
 */
TEST_F(StatTest, Stat) {
  http->replyOk(fmt::format(R"({{"Hash":"{}","NumLinks":2,"BlockSize":98,)"
                            R"("LinksSize":90,"DataSize":8,)"
                            R"("CumulativeSize":1234}})",
                            kHashA));
  const auto path = fmt::format("/ipfs/{}", kHashA);
  EXPECT_OUTCOME_TRUE(stat, mdag::object::stat(path));
  EXPECT_EQ(stat, (Stat{kHashA, 2, 8, 1234}));

  auto sent = http->sent();
  ASSERT_EQ(sent.size(), 1);
  EXPECT_EQ(sent[0].method, mdag::common::ReqMethod::GET);
  EXPECT_EQ(sent[0].url,
            url("object/stat",
                fmt::format("?encoding=json&arg=%2Fipfs%2F{}", kHashA)));
}

/**
 * @given reply without cumulative size
 * @when stat path
 * @then decoding error returned
 */
TEST_F(StatTest, MissingField) {
  http->replyOk(fmt::format(
      R"({{"Hash":"{}","NumLinks":0,"DataSize":0}})", kHashA));
  EXPECT_OUTCOME_ERROR(JsonError::kOutOfRange, mdag::object::stat(kHashA));
}
