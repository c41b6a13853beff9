/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/object.hpp"

#include <algorithm>

#include "api/api.hpp"
#include "codec/multihash.hpp"
#include "common/logger.hpp"
#include "merkledag.pb.h"
#include "name/name.hpp"
#include "object/impl/object_factory.hpp"
#include "object/impl/pb_node_encoder.hpp"
#include "object/object_error.hpp"

namespace mdag::object {
  using impl::ObjectFactory;

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("object")};
      return logger;
    }

    /// object/put reply
    struct Added {
      std::string hash;
    };

    JSON_DECODE(Added) {
      codec::json::Get(j, "Hash", v.hash);
    }
  }  // namespace

  uint64_t Object::size() const {
    uint64_t size{data.size()};
    for (const auto &link : links) {
      size += link.object.size();
    }
    return size;
  }

  outcome::result<CommittedObject> Object::get(std::string_view path) const {
    if (path.empty()) {
      return ObjectError::kEmptyPath;
    }
    if (path.front() == '/') {
      return ObjectError::kAbsolutePath;
    }
    const auto slash{path.find('/')};
    const auto prefix{path.substr(0, slash)};
    const auto suffix{slash == std::string_view::npos ? std::string_view{}
                                                      : path.substr(slash + 1)};
    const auto it{std::find_if(links.begin(), links.end(), [&](auto &link) {
      return link.name == prefix;
    })};
    if (it == links.end()) {
      return ObjectError::kLinkNotFound;
    }
    const auto &hash{it->object.hash()};
    if (suffix.empty()) {
      return object::get(hash);
    }
    std::string remote_path;
    remote_path.reserve(hash.size() + 1 + suffix.size());
    remote_path.append(hash).append("/").append(suffix);
    return object::get(remote_path);
  }

  outcome::result<CommittedObject, CommitError> Object::commit() && {
    OUTCOME_EXCEPT(encoded, impl::PBNodeEncoder::encode(*this));
    auto added{api::postData<api::Json<Added>>(
        "object/put", {{"inputenc", "protobuf"}}, encoded)};
    std::error_code error;
    if (!added) {
      error = added.error();
    } else if (!codec::multihash::decode(added.value().hash)) {
      error = make_error_code(ObjectError::kInvalidHash);
    }
    if (error) {
      logger()->warn("commit failed: {:#}", error);
      return outcome::failure(CommitError{error, std::move(*this)});
    }
    logger()->debug("committed {}", added.value().hash);
    auto reference{
        ObjectFactory::makeReference(std::move(added.value().hash), size())};
    return ObjectFactory::makeCommitted(std::move(reference), std::move(*this));
  }

  outcome::result<CommittedObject> get(std::string_view path) {
    OUTCOME_TRY(resolved, name::resolve(path, true));
    OUTCOME_TRY(node,
                api::get<api::Protobuf<pb::PBNode>>("object/get",
                                                    {{"arg", resolved}}));

    Object object;
    object.data.assign(node.data().begin(), node.data().end());
    object.links.reserve(node.links_size());
    for (const auto &link : node.links()) {
      const Bytes hash{link.hash().begin(), link.hash().end()};
      if (!codec::multihash::validate(hash)) {
        logger()->warn("link \"{}\" of {} is not a multihash",
                       link.name(),
                       resolved);
        return ObjectError::kInvalidHash;
      }
      object.links.push_back(
          {link.name(),
           ObjectFactory::makeReference(codec::multihash::encode(hash),
                                        link.tsize())});
    }

    // resolved path is "/ipfs/<hash>", trailing segment names fetched object
    const auto slash{resolved.rfind('/')};
    auto hash{slash == std::string::npos ? resolved
                                         : resolved.substr(slash + 1)};
    if (!codec::multihash::decode(hash)) {
      logger()->warn("resolved path {} does not end with hash", resolved);
      return ObjectError::kInvalidHash;
    }
    const auto size{object.size()};
    return ObjectFactory::makeCommitted(
        ObjectFactory::makeReference(std::move(hash), size), std::move(object));
  }
}  // namespace mdag::object
