/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/mdag/mdag.hpp"
#include "name/name.hpp"

namespace mdag::cli::_mdag {
  struct PinArgs {
    CLI_BOOL("recursive,r", "also pin or unpin linked objects") recursive;

    CLI_OPTS() {
      Opts opts;
      recursive(opts);
      return opts;
    }
  };

  struct Mdag_pin {
    using Args = PinArgs;
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      const auto reference{cliTry(name::lookup(path), "lookup {}", path)};
      cliTry(reference.pin(args.recursive), "pin {}", reference.hash());
      fmt::print("pinned {}\n", reference.toString());
    }
  };

  struct Mdag_unpin {
    using Args = PinArgs;
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      const auto reference{cliTry(name::lookup(path), "lookup {}", path)};
      cliTry(reference.unpin(args.recursive), "unpin {}", reference.hash());
      fmt::print("unpinned {}\n", reference.toString());
    }
  };
}  // namespace mdag::cli::_mdag
