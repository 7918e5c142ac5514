// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/net/FlowKey.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pathspider::net {

constexpr uint8_t kProtoTcp = 6;
constexpr uint8_t kProtoUdp = 17;

/// TCP control bits as they appear in byte 13 of the header.
constexpr uint8_t kTcpFin = 0x01;
constexpr uint8_t kTcpSyn = 0x02;
constexpr uint8_t kTcpRst = 0x04;
constexpr uint8_t kTcpPsh = 0x08;
constexpr uint8_t kTcpAck = 0x10;
constexpr uint8_t kTcpUrg = 0x20;
constexpr uint8_t kTcpEce = 0x40;
constexpr uint8_t kTcpCwr = 0x80;

/**
 * @brief Minimal non-owning TCP header view with helpers for decoding control flags.
 *
 * Stateless and trivially copyable; the options pointer refers into the
 * capture buffer and is only valid during the packet handler call.
 */
struct TcpHeaderView {
    uint32_t seq{0};       ///< TCP sequence number (host endian).
    uint32_t ack{0};       ///< TCP acknowledgement number (host endian).
    uint8_t  flags{0};     ///< All 8 TCP control bits (CWR, ECE, URG, ACK, PSH, RST, SYN, FIN).

    const uint8_t* options{nullptr}; ///< Start of the options region (non-owning).
    std::size_t    options_length{0};

    struct TcpFlags {
        bool cwr;
        bool ece;
        bool urg;
        bool ack;
        bool psh;
        bool rst;
        bool syn;
        bool fin;
    };

    static constexpr TcpFlags decode_flags_direct(uint8_t value) noexcept {
        return TcpFlags{
            (value & kTcpCwr) != 0,
            (value & kTcpEce) != 0,
            (value & kTcpUrg) != 0,
            (value & kTcpAck) != 0,
            (value & kTcpPsh) != 0,
            (value & kTcpRst) != 0,
            (value & kTcpSyn) != 0,
            (value & kTcpFin) != 0
        };
    }

    /**
     * @brief Build a 256-entry compile-time lookup table for fast flag decoding.
     */
    static constexpr std::array<TcpFlags, 256> build_flag_lut() noexcept {
        std::array<TcpFlags, 256> lut{};
        for (std::size_t i = 0; i < lut.size(); ++i) {
            lut[i] = decode_flags_direct(static_cast<uint8_t>(i));
        }
        return lut;
    }

    static const TcpFlags& decode_flags(uint8_t value) noexcept {
        static const auto flag_lut = build_flag_lut();
        return flag_lut[value];
    }

    const TcpFlags& view_flags() const noexcept {
        return decode_flags(flags);
    }
};

/**
 * @brief Lightweight, backend-agnostic view over a parsed packet.
 *
 * PacketParser writes this object to avoid allocation or ownership overhead.
 * All pointers into the packet buffer are valid only during the handler call.
 */
struct PacketView {
    uint8_t    ip_version{0};     ///< 4 or 6.
    IpAddress  src_ip{};
    IpAddress  dst_ip{};
    uint16_t   src_port{0};       ///< 0 for protocols without ports.
    uint16_t   dst_port{0};
    uint8_t    protocol{0};       ///< IPv4 protocol / IPv6 next header after extensions.
    uint8_t    traffic_class{0};  ///< IPv4 TOS or IPv6 traffic class; low 2 bits are ECN.
    uint16_t   ip_length{0};      ///< Total IP length in octets as declared by the header.
    TcpHeaderView tcp{};          ///< Valid when protocol == kProtoTcp.
    uint64_t   payload_bytes{0};  ///< L4 payload length (0 for pure ACKs or empty payloads).
    uint64_t   timestamp_ns{0};   ///< Capture timestamp in nanoseconds.

    uint8_t ecn() const noexcept { return static_cast<uint8_t>(traffic_class & 0x03); }
    bool is_tcp() const noexcept { return protocol == kProtoTcp; }
    bool is_udp() const noexcept { return protocol == kProtoUdp; }
};

/**
 * @brief Handler invoked for each packet decoded by any PacketSource backend.
 */
using PacketHandler = std::function<void(const PacketView&)>;

/**
 * @brief Abstract packet source interface for the observer's ingestion layer.
 *
 * Contract:
 *  - open() initialises the backend for the given locator and prepares polling.
 *  - close() releases backend resources safely.
 *  - poll() fetches up to @p budget packets and delivers them to @p handler;
 *    it returns false on a capture error.
 *  - exhausted() reports that a finite source (a recorded trace) has ended.
 */
class PacketSource {
public:
    virtual ~PacketSource() = default;

    virtual bool open(const std::string& locator) = 0;
    virtual void close() = 0;
    virtual bool poll(const PacketHandler& handler, std::size_t budget = 32) = 0;
    virtual bool exhausted() const { return false; }
};

using PacketSourcePtr = std::unique_ptr<PacketSource>;

} // namespace pathspider::net
