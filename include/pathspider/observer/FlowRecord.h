// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file FlowRecord.h
 * @brief Per-flow state accumulated by the observer and its finalized snapshot.
 */
#include "pathspider/net/FlowKey.h"

#include <cstdint>
#include <variant>

namespace pathspider::observer {

/// Packet direction relative to the measuring host.
enum class Direction {
    Outgoing,  ///< local -> remote
    Incoming   ///< remote -> local
};

enum class FinishReason {
    HandlerStop,  ///< A handler returned false.
    Idle,         ///< No packet within the idle bound.
    Shutdown      ///< Observer stopped with the flow still open.
};

/// Bits used in DirectionCounters::ecn_seen and syn_ecn_seen.
constexpr uint8_t kEcnSeenEct0 = 0x01;
constexpr uint8_t kEcnSeenEct1 = 0x02;
constexpr uint8_t kEcnSeenCe   = 0x04;

/**
 * @brief Counters for one direction of a flow.
 */
struct DirectionCounters {
    uint64_t packets{0};
    uint64_t octets{0};          ///< IP octets, headers included.
    uint64_t payload_octets{0};  ///< Transport payload octets.

    uint8_t initial_flags{0};    ///< TCP flags of the first segment in this direction.
    uint8_t union_flags{0};      ///< OR of all TCP flags seen.
    uint8_t syn_flags{0};        ///< TCP flags of the last SYN seen.
    bool    flags_seen{false};

    uint64_t ect0{0};
    uint64_t ect1{0};
    uint64_t ce{0};
    uint8_t  ecn_seen{0};        ///< kEcnSeen* bits over all packets.
    uint8_t  syn_ecn_seen{0};    ///< kEcnSeen* bits over SYN segments.
};

enum class TfoState {
    Init,
    CookieRequested,
    DataSent,
    Acked,
    Fallback
};

/// Sentinels for TfoProgress::seq/len.
constexpr int64_t kTfoSeqUnset = -1000;
constexpr int64_t kTfoSeqFallback = -500;

struct TfoProgress {
    TfoState state{TfoState::Init};
    int64_t  seq{kTfoSeqUnset};   ///< Sequence number of the data-bearing SYN.
    int64_t  len{kTfoSeqUnset};   ///< Payload length carried by that SYN.
};

const char* to_string(TfoState state) noexcept;
const char* to_string(FinishReason reason) noexcept;

/**
 * @brief Everything the handler pipeline measures for a flow.
 */
struct FlowMetrics {
    uint8_t  ip_version{0};
    uint64_t first_ns{0};
    uint64_t last_ns{0};
    DirectionCounters outgoing{};
    DirectionCounters incoming{};
    TfoProgress tfo{};

    DirectionCounters& counters(Direction dir) noexcept {
        return dir == Direction::Outgoing ? outgoing : incoming;
    }
    const DirectionCounters& counters(Direction dir) const noexcept {
        return dir == Direction::Outgoing ? outgoing : incoming;
    }
};

/**
 * @brief Immutable snapshot of a finalized flow.
 */
struct FlowRecord {
    net::FlowKey key{};
    FlowMetrics  metrics{};
    FinishReason reason{FinishReason::HandlerStop};

    net::ConnectionKey connection_key() const noexcept {
        return net::ConnectionKey{key.local_port, key.remote_ip, key.remote_port};
    }
};

/// Stands in for "no flow record was captured for this connection".
struct Unobserved {};

using FlowObservation = std::variant<Unobserved, FlowRecord>;

} // namespace pathspider::observer
