/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "name/name.hpp"

#include <gtest/gtest.h>

#include "object/impl/object_factory.hpp"
#include "testutil/api/fake_api_test.hpp"
#include "testutil/api/ipfs_replies.hpp"
#include "testutil/outcome.hpp"

using mdag::object::Object;
using mdag::object::impl::ObjectFactory;
using testutil::api::kHashA;
using namespace std::chrono_literals;

class NameTest : public test::FakeApiTest {
 public:
  mdag::object::CommittedObject committed{ObjectFactory::makeCommitted(
      ObjectFactory::makeReference(kHashA, 2), Object{{'h', 'i'}, {}})};
};

/**
 * @given ipns path
 * @when resolve it recursively
 * @then resolved ipfs path returned
 */
TEST_F(NameTest, Resolve) {
  testutil::api::replyResolved(*http, fmt::format("/ipfs/{}/docs", kHashA));
  EXPECT_OUTCOME_TRUE(path, mdag::name::resolve("/ipns/example.com/docs", true));
  EXPECT_EQ(path, fmt::format("/ipfs/{}/docs", kHashA));

  auto sent = http->sent();
  ASSERT_EQ(sent.size(), 1);
  EXPECT_EQ(sent[0].method, mdag::common::ReqMethod::GET);
  EXPECT_EQ(sent[0].url,
            url("resolve",
                "?encoding=json&arg=%2Fipns%2Fexample.com%2Fdocs"
                "&recursive=true"));
}

/**
 * @given non-recursive resolve
 * @when resolve path
 * @then recursive flag is false
 */
TEST_F(NameTest, ResolveNotRecursive) {
  testutil::api::replyResolved(*http, "/ipns/other");
  EXPECT_OUTCOME_TRUE(path, mdag::name::resolve("/ipns/name", false));
  EXPECT_EQ(path, "/ipns/other");
  EXPECT_EQ(http->sent()[0].url,
            url("resolve", "?encoding=json&arg=%2Fipns%2Fname&recursive=false"));
}

/**
 * @given path of stored object
 * @when look it up
 * @then reference with hash and cumulative size from stat returned
 */
TEST_F(NameTest, Lookup) {
  http->replyOk(fmt::format(
      R"({{"Hash":"{}","NumLinks":0,"DataSize":2,"CumulativeSize":10}})",
      kHashA));
  EXPECT_OUTCOME_TRUE(reference, mdag::name::lookup("/ipns/example.com"));
  EXPECT_EQ(reference, ObjectFactory::makeReference(kHashA, 10));
  EXPECT_EQ(http->sent()[0].url,
            url("object/stat", "?encoding=json&arg=%2Fipns%2Fexample.com"));
}

/**
 * @given committed object
 * @when publish it
 * @then name/publish with 24h lifetime and no resolve is posted
 */
TEST_F(NameTest, Publish) {
  http->replyOk(fmt::format(R"({{"Name":"k51","Value":"/ipfs/{}"}})", kHashA));
  EXPECT_OUTCOME_TRUE_1(mdag::name::publish(committed));

  auto sent = http->sent();
  ASSERT_EQ(sent.size(), 1);
  EXPECT_EQ(sent[0].method, mdag::common::ReqMethod::POST);
  EXPECT_EQ(sent[0].url,
            url("name/publish",
                fmt::format("?resolve=false&lifetime=86400s0ns&arg={}",
                            kHashA)));
}

/**
 * @given committed object and lifetime with fraction of second
 * @when publish it for lifetime
 * @then lifetime is sent as seconds and nanoseconds
 */
TEST_F(NameTest, PublishFor) {
  http->replyOk();
  EXPECT_OUTCOME_TRUE_1(mdag::name::publishFor(committed, 1500ms));
  EXPECT_EQ(http->sent()[0].url,
            url("name/publish",
                fmt::format("?resolve=false&lifetime=1s500000000ns&arg={}",
                            kHashA)));
}

/**
 * @given durations
 * @when format them as lifetime
 * @then seconds and nanoseconds parts are printed
 */
TEST(LifetimeTest, Format) {
  EXPECT_EQ(mdag::name::formatLifetime(0s), "0s0ns");
  EXPECT_EQ(mdag::name::formatLifetime(24h), "86400s0ns");
  EXPECT_EQ(mdag::name::formatLifetime(3s + 7ns), "3s7ns");
}

/**
 * @given id reply
 * @when ask for peer id
 * @then node identity returned
 */
TEST_F(NameTest, PeerId) {
  http->replyOk(
      R"({"ID":"QmPeer","PublicKey":"CAAS","Addresses":[],"AgentVersion":"go-ipfs/0.4.23/"})");
  EXPECT_OUTCOME_TRUE(id, mdag::name::peerId());
  EXPECT_EQ(id, "QmPeer");
  EXPECT_EQ(http->sent()[0].url, url("id", "?encoding=json"));
}
