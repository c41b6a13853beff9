/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

namespace mdag::object {
  /**
   * Coarse kind of any error returned by the library
   */
  enum class ErrorKind {
    /// Transport failure: connection, tls, socket, timeout
    kIo,
    /// Malformed response or reference size mismatch
    kInvalidData,
    /// Bad argument: empty or absolute local path, bad endpoint
    kInvalidInput,
    /// No link with requested name
    kNotFound,
    /// Server reported error and everything else
    kOther,
  };

  ErrorKind errorKind(const std::error_code &ec);

  const char *errorKindName(ErrorKind kind);
}  // namespace mdag::object
