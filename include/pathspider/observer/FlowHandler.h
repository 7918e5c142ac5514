// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/net/Packet.h"
#include "pathspider/observer/FlowRecord.h"

#include <memory>
#include <string>
#include <vector>

namespace pathspider::observer {

/**
 * @brief Mutable per-flow accumulator. Only the observer thread touches it.
 */
struct FlowContext {
    net::FlowKey key{};
    FlowMetrics  metrics{};

    FlowRecord finalize(FinishReason reason) const {
        return FlowRecord{key, metrics, reason};
    }
};

/**
 * @brief One step of the packet pipeline.
 *
 * process() returns true to keep tracking the flow, false to stop: the rest
 * of the chain is skipped and the flow is finalized.
 */
class FlowHandler {
public:
    virtual ~FlowHandler() = default;
    virtual const char* name() const noexcept = 0;
    virtual bool process(FlowContext& ctx, const net::PacketView& pkt, Direction dir) = 0;
};

using FlowHandlerPtr = std::unique_ptr<FlowHandler>;
using HandlerChain = std::vector<FlowHandlerPtr>;

/**
 * @brief The four extension points, run in this order for every packet.
 *
 * new_flow runs once, on the packet that creates the flow; returning false
 * there means the flow is not tracked at all.
 */
struct HandlerChains {
    HandlerChain new_flow;
    HandlerChain ip4;
    HandlerChain ip6;
    HandlerChain tcp;
    HandlerChain udp;
};

/// Run @p chain in order; false as soon as one handler asks to stop.
bool run_chain(HandlerChain& chain, FlowContext& ctx, const net::PacketView& pkt, Direction dir);

std::string describe_chains(const HandlerChains& chains);

} // namespace pathspider::observer
