/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/mdag/mdag.hpp"
#include "common/span.hpp"
#include "name/name.hpp"

namespace mdag::cli::_mdag {
  struct Mdag_get : Empty {
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      printObject(cliTry(object::get(path), "fetching {}", path));
    }
  };

  struct Mdag_put {
    struct Args {
      CLI_DEFAULT("data", "object data", std::string, ) data;
      std::vector<std::string> links;

      CLI_OPTS() {
        Opts opts;
        data(opts);
        opts.add_options()("link",
                           po::value(&links)->composing(),
                           "link as name=path, repeatable, order is kept");
        return opts;
      }
    };
    CLI_RUN() {
      Mdag::Api api{argm};
      object::Object draft;
      draft.data = copy(common::span::cbytes(std::string_view{*args.data}));
      for (const auto &arg : args.links) {
        const auto eq{arg.find('=')};
        if (eq == std::string::npos) {
          throw CliError{"--link {} must be name=path", arg};
        }
        const auto path{arg.substr(eq + 1)};
        draft.links.push_back(
            {arg.substr(0, eq), cliTry(name::lookup(path), "lookup {}", path)});
      }
      auto committed{std::move(draft).commit()};
      if (!committed) {
        throw CliError{"commit: {}", committed.error().error};
      }
      fmt::print("{}\n", committed.value().hash());
    }
  };

  struct Mdag_stat : Empty {
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      Mdag::Api api{argm};
      const auto stat{cliTry(object::stat(path), "stat {}", path)};
      fmt::print("Hash: {}\n", stat.hash);
      fmt::print("NumLinks: {}\n", stat.num_links);
      fmt::print("DataSize: {}\n", stat.data_size);
      fmt::print("CumulativeSize: {}\n", stat.cumulative_size);
    }
  };
}  // namespace mdag::cli::_mdag
