/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/error_kind.hpp"

#include <gtest/gtest.h>

#include "api/api_error.hpp"
#include "api/remote_error.hpp"
#include "codec/json/json_errors.hpp"
#include "codec/multihash.hpp"
#include "common/http_requests/curl_error.hpp"
#include "object/object_error.hpp"

using mdag::api::ApiError;
using mdag::object::ErrorKind;
using mdag::object::errorKind;
using mdag::object::ObjectError;

/**
 * @given transport errors
 * @when classify them
 * @then io kind returned
 */
TEST(ErrorKindTest, Io) {
  EXPECT_EQ(errorKind(mdag::common::makeCurlError(CURLE_COULDNT_CONNECT)),
            ErrorKind::kIo);
  EXPECT_EQ(errorKind(std::make_error_code(std::errc::timed_out)),
            ErrorKind::kIo);
  EXPECT_EQ(errorKind(make_error_code(mdag::common::HttpRequestError::kMimeFailure)),
            ErrorKind::kIo);
}

/**
 * @given decoding errors and size mismatch
 * @when classify them
 * @then invalid data kind returned
 */
TEST(ErrorKindTest, InvalidData) {
  EXPECT_EQ(errorKind(make_error_code(mdag::codec::json::JsonError::kWrongType)),
            ErrorKind::kInvalidData);
  EXPECT_EQ(errorKind(make_error_code(
                mdag::codec::multihash::MultihashError::kInvalidMultihash)),
            ErrorKind::kInvalidData);
  EXPECT_EQ(errorKind(make_error_code(ApiError::kInvalidProtobuf)),
            ErrorKind::kInvalidData);
  EXPECT_EQ(errorKind(make_error_code(ObjectError::kSizeMismatch)),
            ErrorKind::kInvalidData);
  EXPECT_EQ(errorKind(make_error_code(ObjectError::kInvalidHash)),
            ErrorKind::kInvalidData);
}

/**
 * @given bad arguments and missing link
 * @when classify them
 * @then invalid input and not found kinds returned
 */
TEST(ErrorKindTest, InputAndNotFound) {
  EXPECT_EQ(errorKind(make_error_code(ObjectError::kEmptyPath)),
            ErrorKind::kInvalidInput);
  EXPECT_EQ(errorKind(make_error_code(ObjectError::kAbsolutePath)),
            ErrorKind::kInvalidInput);
  EXPECT_EQ(errorKind(make_error_code(ApiError::kInvalidEndpoint)),
            ErrorKind::kInvalidInput);
  EXPECT_EQ(errorKind(make_error_code(ObjectError::kLinkNotFound)),
            ErrorKind::kNotFound);
}

/**
 * @given server error
 * @when classify it
 * @then other kind returned
 */
TEST(ErrorKindTest, RemoteIsOther) {
  EXPECT_EQ(errorKind(mdag::api::makeRemoteError("merkledag: not found")),
            ErrorKind::kOther);
  EXPECT_STREQ(mdag::object::errorKindName(ErrorKind::kOther), "other");
  EXPECT_STREQ(mdag::object::errorKindName(ErrorKind::kIo), "io");
}
