/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/mdag/mdag.hpp"
#include "name/name.hpp"

namespace mdag::cli::_mdag {
  struct Mdag_resolve {
    struct Args {
      CLI_BOOL("recursive,r", "resolve until result is an ipfs path")
      recursive;

      CLI_OPTS() {
        Opts opts;
        recursive(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      fmt::print("{}\n",
                 cliTry(name::resolve(path, args.recursive), "resolve {}", path));
    }
  };

  struct Mdag_lookup : Empty {
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      const auto reference{cliTry(name::lookup(path), "lookup {}", path)};
      fmt::print("{} {}\n", reference.toString(), reference.size());
    }
  };

  struct Mdag_publish {
    struct Args {
      CLI_DEFAULT("lifetime",
                  "record lifetime in seconds",
                  int64_t,
                  {std::chrono::seconds{name::kDefaultLifetime}.count()})
      lifetime;

      CLI_OPTS() {
        Opts opts;
        lifetime(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      if (*args.lifetime <= 0) {
        throw CliError{"--lifetime must be positive"};
      }
      Mdag::Api api{argm};
      const auto committed{cliTry(object::get(path), "fetching {}", path)};
      cliTry(name::publishFor(committed, std::chrono::seconds{*args.lifetime}),
             "publish {}",
             committed.hash());
      const auto id{cliTry(name::peerId(), "peer id")};
      fmt::print("/ipns/{} -> {}\n", id, committed.reference().toString());
    }
  };

  struct Mdag_id : Empty {
    CLI_RUN() {
      Mdag::Api api{argm};
      fmt::print("{}\n", cliTry(name::peerId(), "peer id"));
    }
  };
}  // namespace mdag::cli::_mdag
