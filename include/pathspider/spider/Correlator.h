// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/observer/FlowRecord.h"
#include "pathspider/spider/Records.h"
#include "pathspider/util/BlockingQueue.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <unordered_map>

namespace pathspider::spider {

struct CorrelatorStats {
    uint64_t merged_observed{0};
    uint64_t merged_unobserved{0};
    uint64_t flows_discarded{0};    ///< Flow records no active record ever claimed.
};

/**
 * @brief Joins active records with flow records on (local port, remote ip, remote port).
 *
 * Either side may arrive first; matching is FIFO per key. After the active
 * stream ends, unmatched active records wait for a late flow record and are
 * then emitted as unobserved. EndOfStream is forwarded to the output last.
 */
class Correlator {
public:
    using MergeFn = std::function<MergedRecord(const observer::FlowObservation&, const ActiveRecord&)>;

    /// How long unmatched active records wait once the active stream has ended.
    enum class GraceMode {
        Deadline,       ///< At most the grace period, or until the flow stream ends.
        UntilFlowsEnd,  ///< Until the flow stream ends; its producer applies the grace period.
    };

    Correlator(Stream<ActiveRecord>& actives,
               Stream<observer::FlowRecord>& flows,
               Stream<MergedRecord>& output,
               MergeFn merge,
               std::chrono::milliseconds grace_period,
               GraceMode mode = GraceMode::Deadline);

    /// Consume both inputs until the active stream ends and the grace wait is over.
    void run();

    const CorrelatorStats& stats() const noexcept { return stats_; }

private:
    void on_active(ActiveRecord rec);
    void on_flow(observer::FlowRecord rec);
    /// Returns true once the flow stream has ended.
    bool drain_flows();
    void emit(const observer::FlowObservation& flow, const ActiveRecord& active);
    std::size_t pending_count() const;

    Stream<ActiveRecord>& actives_;
    Stream<observer::FlowRecord>& flows_;
    Stream<MergedRecord>& output_;
    MergeFn merge_;
    std::chrono::milliseconds grace_period_;
    GraceMode mode_;

    std::unordered_map<net::ConnectionKey, std::deque<ActiveRecord>, net::ConnectionKeyHash> pending_;
    std::unordered_map<net::ConnectionKey, std::deque<observer::FlowRecord>, net::ConnectionKeyHash> early_flows_;
    bool flows_ended_{false};
    CorrelatorStats stats_{};
};

} // namespace pathspider::spider
