/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/remote_error.hpp"

#include <deque>
#include <limits>
#include <map>
#include <mutex>

namespace mdag::api {
  namespace {
    constexpr std::string_view kDropped{"remote error, message dropped"};

    /**
     * Error value is a sequence number of interned message.
     * Well-known messages take first values and stay forever, other
     * messages are evicted in insertion order.
     */
    struct RemoteErrorCategory : std::error_category {
      RemoteErrorCategory() {
        add(kNotPinned);
        add(kInvalidRefPath);
        permanent = next - 1;
      }

      const char *name() const noexcept override {
        return "IpfsRemoteError";
      }

      std::string message(int value) const override {
        std::lock_guard lock{mutex};
        auto it{messages.find(value)};
        if (it == messages.end()) {
          return std::string{kDropped};
        }
        return it->second;
      }

      int intern(std::string_view message) const {
        std::lock_guard lock{mutex};
        auto it{index.find(message)};
        if (it != index.end()) {
          return it->second;
        }
        if (order.size() == kMaxRemoteMessages) {
          auto oldest{messages.find(order.front())};
          index.erase(oldest->second);
          messages.erase(oldest);
          order.pop_front();
        }
        const auto value{add(message)};
        order.push_back(value);
        return value;
      }

     private:
      int add(std::string_view message) const {
        const auto value{next};
        next = next == std::numeric_limits<int>::max() ? permanent + 1
                                                       : next + 1;
        auto &text{messages.emplace(value, message).first->second};
        index.emplace(text, value);
        return value;
      }

      mutable std::mutex mutex;
      mutable std::map<int, std::string> messages;
      mutable std::map<std::string_view, int, std::less<>> index;
      // evictable values, oldest first
      mutable std::deque<int> order;
      mutable int next{1};
      int permanent{};
    };
  }  // namespace

  const std::error_category &remoteErrorCategory() {
    static const RemoteErrorCategory category;
    return category;
  }

  std::error_code makeRemoteError(std::string_view message) {
    const auto &category{
        static_cast<const RemoteErrorCategory &>(remoteErrorCategory())};
    return {category.intern(message), category};
  }

  bool isRemoteError(const std::error_code &ec, std::string_view message) {
    return ec.category() == remoteErrorCategory() && ec.message() == message;
  }
}  // namespace mdag::api
