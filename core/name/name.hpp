/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string_view>

#include "object/committed_object.hpp"

namespace mdag::name {
  using object::CommittedObject;
  using object::Reference;

  constexpr std::chrono::hours kDefaultLifetime{24};

  /**
   * Resolve path to "/ipfs/<hash>" form
   * @param path - ipfs or ipns path, may have tail
   * @param recursive - resolve until result is not an ipns name
   * @return resolved path, may keep a trailing tail
   */
  outcome::result<std::string> resolve(std::string_view path, bool recursive);

  /**
   * Make reference to object by path without downloading it
   */
  outcome::result<Reference> lookup(std::string_view path);

  /// Publish object under node identity for default lifetime
  outcome::result<void> publish(const CommittedObject &object);

  outcome::result<void> publishFor(const CommittedObject &object,
                                   std::chrono::nanoseconds lifetime);

  /// Format duration as "<secs>s<nanos>ns"
  std::string formatLifetime(std::chrono::nanoseconds lifetime);

  /**
   * Identity of connected node, ipns names of published objects are
   * "/ipns/<peer id>"
   */
  outcome::result<std::string> peerId();
}  // namespace mdag::name
