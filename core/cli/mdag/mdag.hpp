/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "cli/cli.hpp"
#include "config/client_config.hpp"
#include "object/committed_object.hpp"

namespace mdag::cli::_mdag {
  /// Root command, holds client options shared by every subcommand
  struct Mdag {
    struct Args {
      CLI_OPTIONAL("api", "api endpoint url", std::string) api;
      CLI_OPTIONAL("timeout", "request timeout in milliseconds", int64_t)
      timeout;
      CLI_OPTIONAL("log", "log level, [e,w,i,d,t]", char) log;
      CLI_OPTIONAL("config", "json config file", std::string) config;

      CLI_OPTS() {
        Opts opts;
        api(opts);
        timeout(opts);
        log(opts);
        config(opts);
        return opts;
      }
    };
    CLI_NO_RUN();

    /**
     * Applies client config, create at start of command which talks to node
     */
    struct Api {
      explicit Api(const ArgsMap &argm) {
        const auto &args{argm.of<Mdag>()};
        auto client{config::ClientConfig::defaults()};
        if (args.config) {
          config::Config file;
          cliTry(file.load(*args.config), "loading config {}", *args.config);
          cliTry(client.merge(file), "reading config {}", *args.config);
        }
        if (args.api) {
          client.api_endpoint = *args.api;
        }
        if (args.timeout) {
          if (*args.timeout < 0) {
            throw CliError{"--timeout must not be negative"};
          }
          client.timeout = std::chrono::milliseconds{*args.timeout};
        }
        if (args.log) {
          client.log_level = *args.log;
        }
        cliTry(config::apply(client), "applying client config");
      }
    };
  };

  /// Printable ascii as is, other bytes as \xNN
  inline std::string escapeBytes(BytesIn bytes) {
    std::string out;
    for (const auto byte : bytes) {
      if (byte >= 0x20 && byte < 0x7F && byte != '\\') {
        out.push_back(static_cast<char>(byte));
      } else {
        out += fmt::format("\\x{:02x}", byte);
      }
    }
    return out;
  }

  inline void printObject(const object::CommittedObject &object) {
    fmt::print("hash: {}\n", object.hash());
    fmt::print("size: {}\n", object.size());
    fmt::print("data: {}\n", escapeBytes(object.data()));
    fmt::print("links: {}\n", object.links().size());
    for (const auto &link : object.links()) {
      fmt::print("  {} {} {}\n",
                 link.name.empty() ? "-" : link.name,
                 link.object.hash(),
                 link.object.size());
    }
  }
}  // namespace mdag::cli::_mdag
