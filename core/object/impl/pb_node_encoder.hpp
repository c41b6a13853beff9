/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "object/object.hpp"

namespace mdag::object::impl {
  /**
   * @class Protobuf-serializer for dag nodes
   * @details Links are written before data, as the reference go
   *          implementation does, so the server computes the same hash
   * @warning Need to update serialization algorithm on Protobuf-scheme change
   */
  class PBNodeEncoder {
   public:
    /**
     * @brief Serialize object
     * @param object - draft with data and ordered links
     * @return Protobuf-encoded PBNode or error if some link hash is not
     *         a base58 multihash
     */
    static outcome::result<Bytes> encode(const Object &object);

   private:
    using PBTag = uint8_t;

    // Protobuf wire types
    enum class PBFieldType : uint8_t {
      VARINT = 0,
      BITS_64,
      LENGTH_DELIMITED,
      START_GROUP,
      END_GROUP,
      BITS_32
    };

    enum class PBLinkOrder : uint8_t { HASH = 1, NAME, SIZE };

    enum class PBNodeOrder : uint8_t { DATA = 1, LINKS };

    /**
     * @brief Serialize single link
     * @param hash - raw multihash bytes
     * @param link - link to serialize
     * @return PBLink bytes without tag and length prefix
     */
    static Bytes serializeLink(const Bytes &hash, const Link &link);

    static void writeBytes(Bytes &out, PBTag tag, BytesIn bytes);

    /**
     * @brief Create Protobuf field header
     * @param type - field type
     * @param order - field order
     * @return Tag value
     */
    static PBTag createTag(PBFieldType type, uint8_t order);
  };
}  // namespace mdag::object::impl
