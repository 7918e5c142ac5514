// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Handlers.h
 * @brief Stock flow handlers that plugins assemble into their chains.
 */
#include "pathspider/observer/FlowHandler.h"

namespace pathspider::observer {

/// new-flow: records the IP version and first timestamp.
class BasicFlowHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "basic_flow"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/// ip4/ip6: per-direction packet and octet counters.
class BasicCountHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "basic_count"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/// ip4/ip6: ECN codepoint counters, split out for SYN segments.
class EcnMarksHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "ecn_marks"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/// tcp: initial, union and last-SYN flag words per direction.
class TcpFlagsHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "tcp_flags"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/// new-flow: resets Fast Open progress to INIT with unset sentinels.
class TfoSetupHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "tfo_setup"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/**
 * @brief tcp: Fast Open progress state machine.
 *
 *   INIT --(in: cookie, nothing sent yet)--> COOKIE_REQUESTED
 *   INIT/COOKIE_REQUESTED --(out: cookie + payload)--> DATA_SENT
 *   DATA_SENT --(in: ack == seq + len + 1)--> ACKED, stop
 *   DATA_SENT --(out: same seq, no cookie)--> FALLBACK
 */
class TfoProgressHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "tfo_progress"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

/// tcp: stop tracking on any FIN.
class TcpCompletedHandler : public FlowHandler {
public:
    const char* name() const noexcept override { return "tcp_completed"; }
    bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) override;
};

} // namespace pathspider::observer
