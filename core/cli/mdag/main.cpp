/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/mdag/name.hpp"
#include "cli/mdag/object.hpp"
#include "cli/mdag/pin.hpp"
#include "cli/run.hpp"

#define CMD(NAME, TYPE, DESCRIPTION) \
  { NAME, tree<TYPE>(DESCRIPTION) }

namespace mdag::cli::_mdag {
  const auto _tree{tree<Mdag>(
      "merkle-dag object client",
      {
          CMD("get", Mdag_get, "fetch object by path"),
          CMD("put", Mdag_put, "commit object from data and links"),
          CMD("stat", Mdag_stat, "show object metadata"),
          CMD("resolve", Mdag_resolve, "resolve path to ipfs path"),
          CMD("lookup", Mdag_lookup, "show reference of object"),
          CMD("pin", Mdag_pin, "pin object"),
          CMD("unpin", Mdag_unpin, "unpin object"),
          CMD("publish", Mdag_publish, "publish object under node identity"),
          CMD("id", Mdag_id, "show node peer id"),
      })};
}  // namespace mdag::cli::_mdag

int main(int argc, const char *argv[]) {
  return mdag::cli::run("mdag", mdag::cli::_mdag::_tree, argc, argv);
}
