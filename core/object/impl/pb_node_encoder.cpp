/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "object/impl/pb_node_encoder.hpp"

#include <libp2p/multi/uvarint.hpp>

#include "codec/multihash.hpp"
#include "common/span.hpp"

namespace mdag::object::impl {
  using libp2p::multi::UVarint;

  outcome::result<Bytes> PBNodeEncoder::encode(const Object &object) {
    Bytes out;
    const auto links_tag{createTag(PBFieldType::LENGTH_DELIMITED,
                                   static_cast<uint8_t>(PBNodeOrder::LINKS))};
    for (const auto &link : object.links) {
      OUTCOME_TRY(hash, codec::multihash::decode(link.object.hash()));
      writeBytes(out, links_tag, serializeLink(hash, link));
    }
    writeBytes(out,
               createTag(PBFieldType::LENGTH_DELIMITED,
                         static_cast<uint8_t>(PBNodeOrder::DATA)),
               object.data);
    return out;
  }

  Bytes PBNodeEncoder::serializeLink(const Bytes &hash, const Link &link) {
    Bytes out;
    writeBytes(out,
               createTag(PBFieldType::LENGTH_DELIMITED,
                         static_cast<uint8_t>(PBLinkOrder::HASH)),
               hash);
    writeBytes(out,
               createTag(PBFieldType::LENGTH_DELIMITED,
                         static_cast<uint8_t>(PBLinkOrder::NAME)),
               common::span::cbytes(std::string_view{link.name}));
    out.push_back(createTag(PBFieldType::VARINT,
                            static_cast<uint8_t>(PBLinkOrder::SIZE)));
    append(out, UVarint{link.object.size()}.toVector());
    return out;
  }

  void PBNodeEncoder::writeBytes(Bytes &out, PBTag tag, BytesIn bytes) {
    out.push_back(tag);
    append(out, UVarint{bytes.size()}.toVector());
    append(out, bytes);
  }

  PBNodeEncoder::PBTag PBNodeEncoder::createTag(PBFieldType type,
                                                uint8_t order) {
    return static_cast<PBTag>((order << 3) | static_cast<uint8_t>(type));
  }
}  // namespace mdag::object::impl
