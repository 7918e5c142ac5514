// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/net/PacketParser.h"

namespace pathspider::net {

namespace {

constexpr uint16_t kEthTypeIpv4 = 0x0800;
constexpr uint16_t kEthTypeIpv6 = 0x86DD;
constexpr uint16_t kEthTypeVlan = 0x8100;

constexpr uint8_t kIpv6HopByHop = 0;
constexpr uint8_t kIpv6Routing  = 43;
constexpr uint8_t kIpv6DestOpts = 60;

// Read a big-endian 16-bit value without unaligned casts (portable and fast).
inline uint16_t load_be16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

// Read a big-endian 32-bit value without unaligned casts (portable and fast).
inline uint32_t load_be32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
           static_cast<uint32_t>(p[3]);
}

/**
 * Fill ports, TCP fields and payload length from the transport header at
 * @p l4. A truncated transport header leaves the L3 information intact.
 */
void decode_l4(const uint8_t* l4, const uint8_t* ip_end, PacketView& view) {
    if (l4 >= ip_end) return;

    if ((view.protocol == kProtoTcp || view.protocol == kProtoUdp) && l4 + 4 <= ip_end) {
        view.src_port = load_be16(l4);
        view.dst_port = load_be16(l4 + 2);
    }

    if (view.protocol == kProtoTcp) {
        if (l4 + 20 > ip_end) return;
        const std::size_t header_bytes = static_cast<std::size_t>(l4[12] >> 4) * 4;
        if (header_bytes < 20 || l4 + header_bytes > ip_end) return;

        view.tcp.seq    = load_be32(l4 + 4);
        view.tcp.ack    = load_be32(l4 + 8);
        view.tcp.flags  = l4[13];
        if (header_bytes > 20) {
            view.tcp.options = l4 + 20;
            view.tcp.options_length = header_bytes - 20;
        }
        const uint8_t* const payload = l4 + header_bytes;
        if (payload < ip_end) {
            view.payload_bytes = static_cast<uint64_t>(ip_end - payload);
        }
    } else if (view.protocol == kProtoUdp) {
        if (l4 + 8 > ip_end) return;
        const uint16_t udp_len = load_be16(l4 + 4);
        if (udp_len < 8) return;
        const uint8_t* udp_end = l4 + udp_len;
        if (udp_end > ip_end) {
            udp_end = ip_end;
        }
        if (l4 + 8 < udp_end) {
            view.payload_bytes = static_cast<uint64_t>(udp_end - (l4 + 8));
        }
    }
}

bool decode_ipv4(const uint8_t* ip, const uint8_t* frame_end, PacketView& view) {
    if (ip + 20 > frame_end) return false;

    const std::size_t ihl_bytes = static_cast<std::size_t>(ip[0] & 0x0F) * 4;
    if (ihl_bytes < 20 || ip + ihl_bytes > frame_end) return false;

    const uint16_t total_len = load_be16(ip + 2);
    if (total_len < ihl_bytes) return false;

    // End of the packet as per the header, clamped to captured bytes.
    const uint8_t* ip_end = ip + total_len;
    if (ip_end > frame_end) {
        ip_end = frame_end;
    }

    view.ip_version    = 4;
    view.traffic_class = ip[1];
    view.ip_length     = total_len;
    view.protocol      = ip[9];
    view.src_ip        = IpAddress::v4(load_be32(ip + 12));
    view.dst_ip        = IpAddress::v4(load_be32(ip + 16));

    // Later fragments carry no transport header.
    const uint16_t frag_offset = static_cast<uint16_t>(load_be16(ip + 6) & 0x1FFF);
    if (frag_offset == 0) {
        decode_l4(ip + ihl_bytes, ip_end, view);
    }
    return true;
}

bool decode_ipv6(const uint8_t* ip, const uint8_t* frame_end, PacketView& view) {
    if (ip + 40 > frame_end) return false;

    const uint16_t payload_len = load_be16(ip + 4);
    const uint8_t* ip_end = ip + 40 + payload_len;
    if (ip_end > frame_end) {
        ip_end = frame_end;
    }

    view.ip_version    = 6;
    view.traffic_class = static_cast<uint8_t>(((ip[0] & 0x0F) << 4) | (ip[1] >> 4));
    view.ip_length     = static_cast<uint16_t>(payload_len + 40);
    view.src_ip        = IpAddress::v6(ip + 8);
    view.dst_ip        = IpAddress::v6(ip + 24);

    uint8_t next = ip[6];
    const uint8_t* cursor = ip + 40;
    while (next == kIpv6HopByHop || next == kIpv6Routing || next == kIpv6DestOpts) {
        if (cursor + 2 > ip_end) return false;
        const std::size_t ext_len = (static_cast<std::size_t>(cursor[1]) + 1) * 8;
        if (cursor + ext_len > ip_end) return false;
        next = cursor[0];
        cursor += ext_len;
    }
    view.protocol = next;

    decode_l4(cursor, ip_end, view);
    return true;
}

} // namespace

bool PacketParser::decode_ip(const uint8_t* ip, std::size_t length, PacketView& out) {
    if (!ip || length < 1) return false;

    PacketView view{};
    const uint8_t* const end = ip + length;
    bool ok = false;
    switch (ip[0] >> 4) {
        case 4: ok = decode_ipv4(ip, end, view); break;
        case 6: ok = decode_ipv6(ip, end, view); break;
        default: return false;
    }
    if (!ok) return false;

    // timestamp_ns is filled by the packet source.
    out = view;
    return true;
}

bool PacketParser::decode(const uint8_t* frame, std::size_t length, PacketView& out, LinkType link) {
    if (!frame) return false;

    uint16_t l3_type = 0;
    std::size_t offset = 0;

    switch (link) {
    case LinkType::RawIp:
        return decode_ip(frame, length, out);

    case LinkType::LinuxSll:
        // 16-byte cooked header; protocol type in the last two bytes.
        if (length < 16) return false;
        l3_type = load_be16(frame + 14);
        offset = 16;
        break;

    case LinkType::Ethernet:
        if (length < 14) return false;
        l3_type = load_be16(frame + 12);
        offset = 14;
        if (l3_type == kEthTypeVlan) {
            if (length < 18) return false;
            l3_type = load_be16(frame + 16);
            offset = 18;
        }
        break;
    }

    if (l3_type != kEthTypeIpv4 && l3_type != kEthTypeIpv6) {
        return false;
    }
    if (length <= offset) return false;
    return decode_ip(frame + offset, length - offset, out);
}

} // namespace pathspider::net
