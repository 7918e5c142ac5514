// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file FlowKey.h
 * @brief Address and flow identity value types shared by every component.
 */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pathspider::net {

/**
 * @brief IPv4 or IPv6 address in network byte order.
 *
 * IPv4 addresses occupy the first four octets; the remainder stays zero so
 * equality and hashing never see stale bytes.
 */
struct IpAddress {
    uint8_t version{0};               ///< 4, 6, or 0 for "unset".
    std::array<uint8_t, 16> octets{};

    static IpAddress v4(uint32_t host_order) noexcept;
    static IpAddress v6(const uint8_t* bytes) noexcept;

    /// Parse a textual IPv4 or IPv6 literal; std::nullopt when invalid.
    static std::optional<IpAddress> parse(const std::string& text);

    bool is_set() const noexcept { return version != 0; }
    std::string to_string() const;

    bool operator==(const IpAddress& o) const noexcept {
        return version == o.version && octets == o.octets;
    }
    bool operator!=(const IpAddress& o) const noexcept { return !(*this == o); }
};

struct IpAddressHash {
    size_t operator()(const IpAddress& a) const noexcept {
        uint64_t hi = 0;
        uint64_t lo = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            hi = (hi << 8) | a.octets[i];
            lo = (lo << 8) | a.octets[i + 8];
        }
        uint64_t v = hi ^ (lo * 0x9e3779b97f4a7c15ULL) ^ a.version;
        v ^= (v >> 33); v *= 0xff51afd7ed558ccdULL;
        v ^= (v >> 33); v *= 0xc4ceb9fe1a85ec53ULL;
        v ^= (v >> 33);
        return static_cast<size_t>(v);
    }
};

/**
 * @brief Canonical flow identity: (local endpoint, remote endpoint, protocol).
 *
 * "Local" is the measuring host side, so both directions of a connection map
 * onto the same key.
 */
struct FlowKey {
    IpAddress local_ip{};
    IpAddress remote_ip{};
    uint16_t  local_port{0};
    uint16_t  remote_port{0};
    uint8_t   protocol{0};

    bool operator==(const FlowKey& o) const noexcept {
        return local_port == o.local_port && remote_port == o.remote_port &&
               protocol == o.protocol && local_ip == o.local_ip && remote_ip == o.remote_ip;
    }
};

struct FlowKeyHash {
    /**
     * @brief Mix all FlowKey fields into a single hash using 64-bit avalanching.
     */
    size_t operator()(const FlowKey& k) const noexcept {
        IpAddressHash ip_hash;
        uint64_t v = static_cast<uint64_t>(ip_hash(k.local_ip)) ^
                     (static_cast<uint64_t>(ip_hash(k.remote_ip)) << 1);
        v ^= (static_cast<uint64_t>(k.local_port) << 24) ^
             (static_cast<uint64_t>(k.remote_port) << 8) ^ k.protocol;
        v ^= (v >> 33); v *= 0xff51afd7ed558ccdULL;
        v ^= (v >> 33); v *= 0xc4ceb9fe1a85ec53ULL;
        v ^= (v >> 33);
        return static_cast<size_t>(v);
    }
};

/**
 * @brief Join key used to pair an active connection with its observed flow.
 *
 * The local port is mandatory: two phases probing the same remote endpoint
 * differ only in the ephemeral port the kernel picked.
 */
struct ConnectionKey {
    uint16_t  local_port{0};
    IpAddress remote_ip{};
    uint16_t  remote_port{0};

    bool operator==(const ConnectionKey& o) const noexcept {
        return local_port == o.local_port && remote_port == o.remote_port &&
               remote_ip == o.remote_ip;
    }
};

struct ConnectionKeyHash {
    size_t operator()(const ConnectionKey& k) const noexcept {
        uint64_t v = static_cast<uint64_t>(IpAddressHash{}(k.remote_ip));
        v ^= (static_cast<uint64_t>(k.local_port) << 16) ^ k.remote_port;
        v ^= (v >> 33); v *= 0xff51afd7ed558ccdULL;
        v ^= (v >> 33);
        return static_cast<size_t>(v);
    }
};

/// Short "{local:port-remote:port/proto}" tag for log lines.
std::string flow_debug_details(const FlowKey& key);

} // namespace pathspider::net
