// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/net/Packet.h"

#include <cstddef>
#include <cstdint>

namespace pathspider::net {

/**
 * @brief Link-layer framing of a captured buffer.
 */
enum class LinkType {
    Ethernet,  ///< DLT_EN10MB, with at most one 802.1Q tag.
    LinuxSll,  ///< DLT_LINUX_SLL (e.g. captures on "any").
    RawIp      ///< DLT_RAW: the buffer starts at the IP header.
};

/**
 * @brief Lightweight packet frame decoder.
 *
 * Decodes a raw frame into a PacketView without owning or allocating memory.
 * Stateless, so it can be called from the capture thread or from tests.
 */
class PacketParser {
public:
    /**
     * @brief Decode a raw frame into a parsed PacketView representation.
     *
     * Every header read is bounds-checked against @p length. IPv6 hop-by-hop,
     * routing and destination-options extension headers are skipped.
     *
     * @return true  if decoding succeeded and @p out is valid.
     * @return false if the frame is malformed or not IPv4/IPv6.
     */
    static bool decode(const std::uint8_t* frame,
                       std::size_t length,
                       PacketView& out,
                       LinkType link = LinkType::Ethernet);

    /// Decode starting directly at an IP header.
    static bool decode_ip(const std::uint8_t* ip, std::size_t length, PacketView& out);
};

} // namespace pathspider::net
