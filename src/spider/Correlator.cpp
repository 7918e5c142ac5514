// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Correlator.h"

#include "pathspider/log/Log.h"

#include <thread>

namespace pathspider::spider {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

} // namespace

Correlator::Correlator(Stream<ActiveRecord>& actives,
                       Stream<observer::FlowRecord>& flows,
                       Stream<MergedRecord>& output,
                       MergeFn merge,
                       std::chrono::milliseconds grace_period,
                       GraceMode mode)
    : actives_(actives),
      flows_(flows),
      output_(output),
      merge_(std::move(merge)),
      grace_period_(grace_period),
      mode_(mode) {}

void Correlator::emit(const observer::FlowObservation& flow, const ActiveRecord& active) {
    if (std::holds_alternative<observer::FlowRecord>(flow)) {
        ++stats_.merged_observed;
    } else {
        ++stats_.merged_unobserved;
    }
    output_.push(merge_(flow, active));
}

void Correlator::on_active(ActiveRecord rec) {
    const auto key = rec.connection_key();
    auto it = early_flows_.find(key);
    if (it != early_flows_.end() && !it->second.empty()) {
        observer::FlowRecord flow = std::move(it->second.front());
        it->second.pop_front();
        if (it->second.empty()) early_flows_.erase(it);
        emit(observer::FlowObservation{std::move(flow)}, rec);
        return;
    }
    pending_[key].push_back(std::move(rec));
}

void Correlator::on_flow(observer::FlowRecord rec) {
    const auto key = rec.connection_key();
    auto it = pending_.find(key);
    if (it != pending_.end() && !it->second.empty()) {
        ActiveRecord active = std::move(it->second.front());
        it->second.pop_front();
        if (it->second.empty()) pending_.erase(it);
        emit(observer::FlowObservation{std::move(rec)}, active);
        return;
    }
    early_flows_[key].push_back(std::move(rec));
}

bool Correlator::drain_flows() {
    while (!flows_ended_) {
        auto item = flows_.try_pop();
        if (!item) break;
        if (is_end_of_stream(*item)) {
            flows_ended_ = true;
            break;
        }
        on_flow(std::get<observer::FlowRecord>(std::move(*item)));
    }
    return flows_ended_;
}

std::size_t Correlator::pending_count() const {
    std::size_t n = 0;
    for (const auto& kv : pending_) n += kv.second.size();
    return n;
}

void Correlator::run() {
    // Phase A: until the scheduler says it is done.
    for (;;) {
        drain_flows();
        auto item = actives_.pop_for(kPollInterval);
        if (!item) continue;
        if (is_end_of_stream(*item)) break;
        on_active(std::get<ActiveRecord>(std::move(*item)));
    }

    // Phase B: give late flow records a chance.
    PSLOG_DEBUG("Active stream ended, %zu records waiting for flows", pending_count());
    if (mode_ == GraceMode::UntilFlowsEnd) {
        while (!drain_flows()) {
            std::this_thread::sleep_for(kPollInterval);
        }
    } else {
        const auto deadline = std::chrono::steady_clock::now() + grace_period_;
        while (!pending_.empty() && std::chrono::steady_clock::now() < deadline) {
            if (drain_flows()) break;
            std::this_thread::sleep_for(kPollInterval);
        }
        drain_flows();
    }

    for (auto& [key, actives] : pending_) {
        for (const auto& active : actives) {
            emit(observer::FlowObservation{observer::Unobserved{}}, active);
        }
    }
    pending_.clear();

    for (const auto& kv : early_flows_) {
        stats_.flows_discarded += kv.second.size();
    }
    early_flows_.clear();

    PSLOG_INFO("Correlator done: %llu observed, %llu unobserved, %llu unmatched flows discarded",
               static_cast<unsigned long long>(stats_.merged_observed),
               static_cast<unsigned long long>(stats_.merged_unobserved),
               static_cast<unsigned long long>(stats_.flows_discarded));
    output_.push(EndOfStream{});
}

} // namespace pathspider::spider
