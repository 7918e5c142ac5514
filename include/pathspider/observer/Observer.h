// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/config/Config.h"
#include "pathspider/net/Packet.h"
#include "pathspider/observer/FlowHandler.h"
#include "pathspider/observer/PortFilter.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pathspider::observer {

struct ObserverOptions {
    std::string locator;                        ///< int:<if> | pcapfile:<path>
    PortFilter ports{};
    std::vector<net::IpAddress> local_addresses{};
    uint64_t idle_timeout_ns{30ULL * 1000000000ULL};
    std::size_t poll_budget{64};

    static ObserverOptions from_config(const Config& cfg);
};

struct ObserverStats {
    uint64_t packets_seen{0};
    uint64_t packets_ignored{0};   ///< Not TCP/UDP, filtered port, or trailing a finished flow.
    uint64_t flows_created{0};
    uint64_t flows_emitted{0};
};

/**
 * @brief Passive flow engine.
 *
 * Owns the capture source, assigns packets to flows, drives the handler
 * chains and emits one FlowRecord per finalized flow through the sink.
 *
 * Threading model:
 *  - run() and every other mutating method belong to the observer thread.
 *  - The sink is invoked on that thread.
 */
class Observer {
public:
    using RecordSink = std::function<void(FlowRecord)>;

    /**
     * @brief Build an observer with an explicit (possibly null) packet source.
     *
     * A null source is fine for callers that feed process_packet() directly;
     * run() then throws ObserverError.
     */
    Observer(ObserverOptions options,
             HandlerChains chains,
             RecordSink sink,
             net::PacketSourcePtr source = nullptr);

    /**
     * @brief Create the capture source from @p cfg and open it.
     * @throws ObserverError when no source exists or it cannot be opened.
     */
    static std::unique_ptr<Observer> create(const Config& cfg,
                                            HandlerChains chains,
                                            RecordSink sink);

    Observer(const Observer&) = delete;
    Observer& operator=(const Observer&) = delete;

    /**
     * @brief Poll the source until @p stop is set, then flush open flows.
     * @throws ObserverError on a capture failure.
     */
    void run(const std::atomic<bool>& stop);

    /// Feed one decoded packet through the pipeline.
    void process_packet(const net::PacketView& pkt);

    /// Finalize flows silent since before now_ns - idle_timeout.
    void expire_idle(uint64_t now_ns);

    /// Finalize every open flow with @p reason.
    void flush_all(FinishReason reason);

    std::size_t open_flows() const noexcept { return flows_.size(); }
    const ObserverStats& stats() const noexcept { return stats_; }

private:
    struct Oriented {
        net::FlowKey key;
        Direction dir;
    };

    Oriented orient(const net::PacketView& pkt) const;
    bool is_local(const net::IpAddress& addr) const;
    void finalize(const net::FlowKey& key, FinishReason reason);
    uint64_t clock_ns() const;

    ObserverOptions options_;
    HandlerChains chains_;
    RecordSink sink_;
    net::PacketSourcePtr source_;

    std::unordered_map<net::FlowKey, FlowContext, net::FlowKeyHash> flows_;
    // Recently finalized keys and when they finished.
    std::unordered_map<net::FlowKey, uint64_t, net::FlowKeyHash> finished_;

    uint64_t latest_packet_ns_{0};
    std::chrono::steady_clock::time_point latest_packet_wall_{};
    ObserverStats stats_{};
};

} // namespace pathspider::observer
