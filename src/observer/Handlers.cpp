// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/observer/Handlers.h"

#include "pathspider/log/Log.h"
#include "pathspider/net/TcpOptions.h"

namespace pathspider::observer {

namespace {

uint8_t ecn_bit(uint8_t codepoint) noexcept {
    switch (codepoint) {
        case 0x02: return kEcnSeenEct0;
        case 0x01: return kEcnSeenEct1;
        case 0x03: return kEcnSeenCe;
        default:   return 0;
    }
}

} // namespace

bool run_chain(HandlerChain& chain, FlowContext& ctx, const net::PacketView& pkt, Direction dir) {
    for (auto& handler : chain) {
        if (!handler->process(ctx, pkt, dir)) {
            PSLOG_TRACE("%s stopped %s", handler->name(),
                        net::flow_debug_details(ctx.key).c_str());
            return false;
        }
    }
    return true;
}

std::string describe_chains(const HandlerChains& chains) {
    std::string out;
    auto append = [&out](const char* label, const HandlerChain& chain) {
        out.append(label);
        out.push_back('[');
        for (std::size_t i = 0; i < chain.size(); ++i) {
            if (i) out.push_back(',');
            out.append(chain[i]->name());
        }
        out.append("] ");
    };
    append("new_flow", chains.new_flow);
    append("ip4", chains.ip4);
    append("ip6", chains.ip6);
    append("tcp", chains.tcp);
    append("udp", chains.udp);
    if (!out.empty()) out.pop_back();
    return out;
}

const char* to_string(TfoState state) noexcept {
    switch (state) {
        case TfoState::Init:            return "init";
        case TfoState::CookieRequested: return "cookie_requested";
        case TfoState::DataSent:        return "data_sent";
        case TfoState::Acked:           return "acked";
        case TfoState::Fallback:        return "fallback";
    }
    return "?";
}

const char* to_string(FinishReason reason) noexcept {
    switch (reason) {
        case FinishReason::HandlerStop: return "complete";
        case FinishReason::Idle:        return "idle";
        case FinishReason::Shutdown:    return "shutdown";
    }
    return "?";
}

bool BasicFlowHandler::process(FlowContext& ctx, const net::PacketView& pkt, Direction) {
    ctx.metrics.ip_version = pkt.ip_version;
    ctx.metrics.first_ns = pkt.timestamp_ns;
    ctx.metrics.last_ns = pkt.timestamp_ns;
    return true;
}

bool BasicCountHandler::process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) {
    auto& c = ctx.metrics.counters(dir);
    ++c.packets;
    c.octets += pkt.ip_length;
    c.payload_octets += pkt.payload_bytes;
    return true;
}

bool EcnMarksHandler::process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) {
    auto& c = ctx.metrics.counters(dir);
    const uint8_t cp = pkt.ecn();
    switch (cp) {
        case 0x02: ++c.ect0; break;
        case 0x01: ++c.ect1; break;
        case 0x03: ++c.ce;   break;
        default: break;
    }
    const uint8_t bit = ecn_bit(cp);
    c.ecn_seen |= bit;
    if (pkt.is_tcp() && pkt.tcp.view_flags().syn) {
        c.syn_ecn_seen |= bit;
    }
    return true;
}

bool TcpFlagsHandler::process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) {
    auto& c = ctx.metrics.counters(dir);
    const uint8_t flags = pkt.tcp.flags;
    if (!c.flags_seen) {
        c.initial_flags = flags;
        c.flags_seen = true;
    }
    c.union_flags |= flags;
    if (pkt.tcp.view_flags().syn) {
        c.syn_flags = flags;
    }
    return true;
}

bool TfoSetupHandler::process(FlowContext& ctx, const net::PacketView&, Direction) {
    ctx.metrics.tfo = TfoProgress{};
    return true;
}

bool TfoProgressHandler::process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) {
    auto& tfo = ctx.metrics.tfo;
    const bool outgoing = dir == Direction::Outgoing;
    const bool has_data = pkt.payload_bytes > 0;
    const auto option = net::parse_fast_open(pkt.tcp.options, pkt.tcp.options_length);
    const bool has_cookie = option == net::FastOpenOption::Cookie;

    if (outgoing && has_cookie && has_data &&
        (tfo.state == TfoState::Init || tfo.state == TfoState::CookieRequested)) {
        tfo.seq = pkt.tcp.seq;
        tfo.len = static_cast<int64_t>(pkt.payload_bytes);
        tfo.state = TfoState::DataSent;
        return true;
    }

    if (!outgoing && tfo.state == TfoState::DataSent &&
        pkt.tcp.ack == static_cast<uint32_t>(tfo.seq + tfo.len + 1)) {
        tfo.state = TfoState::Acked;
        return false;
    }

    if (outgoing && tfo.state == TfoState::DataSent && !has_cookie &&
        static_cast<int64_t>(pkt.tcp.seq) == tfo.seq) {
        tfo.state = TfoState::Fallback;
        tfo.seq = kTfoSeqFallback;
        tfo.len = kTfoSeqFallback;
        return true;
    }

    if (!outgoing && has_cookie && tfo.state == TfoState::Init) {
        tfo.state = TfoState::CookieRequested;
    }
    return true;
}

bool TcpCompletedHandler::process(FlowContext&, const net::PacketView& pkt, Direction) {
    return !pkt.tcp.view_flags().fin;
}

} // namespace pathspider::observer
