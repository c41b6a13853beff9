/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <map>
#include <memory>
#include <typeindex>
#include <vector>

#include "cli/try.hpp"

#define CLI_BOOL(NAME, DESCRIPTION)                               \
  struct {                                                        \
    bool v{};                                                     \
    void operator()(Opts &opts) {                                 \
      opts.add_options()(NAME, po::bool_switch(&v), DESCRIPTION); \
    }                                                             \
    operator bool() const {                                       \
      return v;                                                   \
    }                                                             \
  }

#define CLI_DEFAULT(NAME, DESCRIPTION, TYPE, INIT)          \
  struct {                                                  \
    TYPE v INIT;                                            \
    void operator()(Opts &opts) {                           \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION); \
    }                                                       \
    auto &operator*() const {                               \
      return v;                                             \
    }                                                       \
  }

#define CLI_OPTIONAL(NAME, DESCRIPTION, TYPE)               \
  struct {                                                  \
    boost::optional<TYPE> v;                                \
    void operator()(Opts &opts) {                           \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION); \
    }                                                       \
    operator bool() const {                                 \
      return v.operator bool();                             \
    }                                                       \
    auto &operator*() const {                               \
      if (!v) {                                             \
        throw ::mdag::cli::CliError{                        \
            "--{} argument is required but missing", NAME}; \
      }                                                     \
      return *v;                                            \
    }                                                       \
  }

#define CLI_OPTS() ::mdag::cli::Opts opts()
#define CLI_RUN()                  \
  static ::mdag::cli::RunResult run( \
      const ::mdag::cli::ArgsMap &argm, Args &args, ::mdag::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace mdag::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;

  using RunResult = void;

  /// Parsed options of every command on the way from root to leaf
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;

    template <typename Cmd>
    typename Cmd::Args &of() const {
      return *static_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };

  /// Positional arguments left after options
  using Argv = std::vector<std::string>;

  inline const std::string &cliArgv(const Argv &argv,
                                    size_t i,
                                    std::string_view name) {
    if (i < argv.size()) {
      return argv[i];
    }
    throw CliError{"positional argument {} is required but missing", name};
  }

  template <typename T>
  T cliArgv(const std::string &arg, std::string_view name) {
    boost::any out;
    try {
      po::value<T>()->xparse(out, Argv{arg});
    } catch (po::validation_error &e) {
      e.set_option_name(std::string{name});
      throw;
    }
    return boost::any_cast<T>(out);
  }

  template <typename T>
  T cliArgv(const Argv &argv, size_t i, std::string_view name) {
    return cliArgv<T>(cliArgv(argv, i, name), name);
  }

  /// Command without options
  struct Empty {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
  };
  using Group = Empty;

  /// Thrown by command to print its help
  struct ShowHelp {};
}  // namespace mdag::cli
