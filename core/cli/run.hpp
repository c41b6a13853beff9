/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstdlib>
#include <fmt/ranges.h>
#include <iostream>

#include "cli/tree.hpp"

namespace mdag::cli {
  inline bool isDash(const std::string &s) {
    return !s.empty() && s[0] == '-';
  }
  inline bool isDashDash(const std::string &s) {
    return s == "--";
  }

  /**
   * Parse options of one command level.
   * Stops at first positional argument, which is either subcommand name or
   * argument of the command.
   * @return iterator to first positional argument or end
   */
  inline Argv::iterator parseOptions(po::variables_map &vm,
                                     const Opts &opts,
                                     Argv::iterator begin,
                                     Argv::iterator end) {
    po::parsed_options parsed{&opts};
    while (begin != end && isDash(*begin)) {
      if (isDashDash(*begin)) {
        ++begin;
        break;
      }
      const auto it{std::find_if(begin + 1, end, isDash)};
      const auto options{
          po::command_line_parser{Argv{begin, it}}.options(opts).run().options};
      if (options.empty()) {
        break;
      }
      auto consumed{false};
      for (const auto &option : options) {
        if (option.string_key.empty()) {
          break;
        }
        parsed.options.emplace_back(option);
        begin += option.original_tokens.size();
        consumed = true;
      }
      if (!consumed) {
        break;
      }
    }
    po::store(parsed, vm);
    return begin;
  }

  inline void printHelp(const std::vector<std::string> &cmds,
                        const Tree &tree,
                        const Opts &opts) {
    fmt::print("name:\n  {}\n", fmt::join(cmds, " "));
    if (!tree.description.empty()) {
      fmt::print("description:\n  {}\n", tree.description);
    }
    std::cout << "options:\n" << opts;
    if (!tree.sub.empty()) {
      fmt::print("subcommands:\n");
      for (const auto &[name, sub] : tree.sub) {
        fmt::print("  {:<12} {}\n", name, sub.description);
      }
    }
  }

  /**
   * Walk command tree along argv and run selected command
   * @return process exit status
   */
  inline int run(std::string app, const Tree &root, Argv argv) {
    const Tree *tree{&root};
    std::vector<std::string> cmds{std::move(app)};
    ArgsMap argm;
    auto argv_it{argv.begin()};
    while (true) {
      auto args{tree->args()};
      args.opts.add_options()("help,h", "print help");
      po::variables_map vm;
      try {
        argv_it = parseOptions(vm, args.opts, argv_it, argv.end());
        po::notify(vm);
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
        return EXIT_FAILURE;
      }
      if (vm.count("help") != 0) {
        printHelp(cmds, *tree, args.opts);
        return EXIT_SUCCESS;
      }
      argm._.emplace(args._);
      if (argv_it != argv.end()) {
        const auto sub_it{tree->sub.find(*argv_it)};
        if (sub_it != tree->sub.end()) {
          ++argv_it;
          cmds.emplace_back(sub_it->first);
          tree = &sub_it->second;
          continue;
        }
      }
      if (!tree->run) {
        printHelp(cmds, *tree, args.opts);
        return argv_it == argv.end() ? EXIT_SUCCESS : EXIT_FAILURE;
      }
      try {
        tree->run(argm, {argv_it, argv.end()});
        return EXIT_SUCCESS;
      } catch (ShowHelp &) {
        printHelp(cmds, *tree, args.opts);
        return EXIT_SUCCESS;
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
      } catch (CliError &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
      } catch (std::system_error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
      }
      return EXIT_FAILURE;
    }
  }

  inline int run(std::string app, const Tree &tree, int argc, const char *argv[]) {
    return run(std::move(app), tree, Argv{argv + 1, argv + argc});
  }
}  // namespace mdag::cli
