/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_TEST_TESTUTIL_API_IPFS_REPLIES_HPP
#define CPP_MERKLEDAG_TEST_TESTUTIL_API_IPFS_REPLIES_HPP

#include <fmt/format.h>

#include "codec/multihash.hpp"
#include "merkledag.pb.h"
#include "testutil/http/fake_request_factory.hpp"

namespace testutil::api {
  /// Well-known hashes of small unixfs objects
  constexpr auto kHashEmptyDir{"QmUNLLsPACCz1vLxQVkXqqLX5R1X345qqfHbsf67hvA3Nn"};
  constexpr auto kHashA{"QmT78zSuBmuS4z925WZfrqQ1qHaJ56DQaTfyMUF7F8ff5o"};
  constexpr auto kHashB{"QmPZ9gcCEpqKTo6aq61g2nXGUhM4iCL3ewB6LDXZCtioEB"};
  constexpr auto kHashC{"QmbFMke1KXqnYyBBWxB74N4c5SBnJMVAiMNRcGu6x1AwQH"};

  struct PbLink {
    std::string name;
    std::string hash;
    uint64_t size{};
  };

  /// Protobuf node as served by object/get
  inline mdag::Bytes pbNode(std::string_view data,
                            const std::vector<PbLink> &links = {}) {
    mdag::pb::PBNode node;
    node.set_data(std::string{data});
    for (const auto &link : links) {
      auto hash = mdag::codec::multihash::decode(link.hash).value();
      auto pb_link = node.add_links();
      pb_link->set_hash(std::string{hash.begin(), hash.end()});
      pb_link->set_name(link.name);
      pb_link->set_tsize(link.size);
    }
    auto str = node.SerializeAsString();
    return {str.begin(), str.end()};
  }

  /// resolve reply
  inline void replyResolved(http::FakeRequestFactory &http,
                            std::string_view path) {
    http.replyOk(fmt::format(R"({{"Path":"{}"}})", path));
  }

  /// resolve and object/get replies for fetch of object with given hash
  inline void replyObject(http::FakeRequestFactory &http,
                          std::string_view hash,
                          std::string_view data,
                          const std::vector<PbLink> &links = {}) {
    replyResolved(http, fmt::format("/ipfs/{}", hash));
    http.replyOk(pbNode(data, links));
  }

  /// object/put reply
  inline void replyAdded(http::FakeRequestFactory &http,
                         std::string_view hash) {
    http.replyOk(fmt::format(R"({{"Hash":"{}","Links":[]}})", hash));
  }
}  // namespace testutil::api

#endif  // CPP_MERKLEDAG_TEST_TESTUTIL_API_IPFS_REPLIES_HPP
