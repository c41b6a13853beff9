/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "name/name.hpp"

#include "api/api.hpp"
#include "common/logger.hpp"
#include "object/impl/object_factory.hpp"

namespace mdag::name {
  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("name")};
      return logger;
    }

    struct Resolved {
      std::string path;
    };

    JSON_DECODE(Resolved) {
      codec::json::Get(j, "Path", v.path);
    }

    struct Identity {
      std::string id;
    };

    JSON_DECODE(Identity) {
      codec::json::Get(j, "ID", v.id);
    }
  }  // namespace

  outcome::result<std::string> resolve(std::string_view path, bool recursive) {
    OUTCOME_TRY(resolved,
                api::get<api::Json<Resolved>>(
                    "resolve",
                    {{"arg", std::string{path}},
                     {"recursive", api::boolToStr(recursive)}}));
    logger()->debug("resolved {} to {}", path, resolved.path);
    return std::move(resolved.path);
  }

  outcome::result<Reference> lookup(std::string_view path) {
    OUTCOME_TRY(stat, object::stat(path));
    return object::impl::ObjectFactory::makeReference(std::move(stat.hash),
                                                      stat.cumulative_size);
  }

  outcome::result<void> publish(const CommittedObject &object) {
    return publishFor(object, kDefaultLifetime);
  }

  outcome::result<void> publishFor(const CommittedObject &object,
                                   std::chrono::nanoseconds lifetime) {
    logger()->debug("publish {} for {}", object.hash(), formatLifetime(lifetime));
    return api::post<api::Ignore>("name/publish",
                                  {{"resolve", api::boolToStr(false)},
                                   {"lifetime", formatLifetime(lifetime)},
                                   {"arg", object.hash()}});
  }

  std::string formatLifetime(std::chrono::nanoseconds lifetime) {
    const auto secs{std::chrono::duration_cast<std::chrono::seconds>(lifetime)};
    const auto nanos{lifetime - secs};
    return std::to_string(secs.count()) + "s" + std::to_string(nanos.count())
           + "ns";
  }

  outcome::result<std::string> peerId() {
    OUTCOME_TRY(identity, api::get<api::Json<Identity>>("id"));
    return std::move(identity.id);
  }
}  // namespace mdag::name
