// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/observer/Observer.h"

#include "pathspider/Errors.h"
#include "pathspider/log/Log.h"
#include "pathspider/net/PacketSourceFactory.h"

#include <thread>

namespace pathspider::observer {

namespace {

constexpr auto kExpireInterval = std::chrono::milliseconds(500);
constexpr auto kExhaustedSleep = std::chrono::milliseconds(50);

uint64_t wall_clock_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

ObserverOptions ObserverOptions::from_config(const Config& cfg) {
    ObserverOptions opts;
    opts.locator = cfg.observer.source;
    opts.ports = PortFilter(cfg.observer.ports);
    for (const auto& text : cfg.observer.local_addresses) {
        if (auto addr = net::IpAddress::parse(text)) {
            opts.local_addresses.push_back(*addr);
        } else {
            PSLOG_WARN("Ignoring invalid local address '%s'", text.c_str());
        }
    }
    opts.idle_timeout_ns = static_cast<uint64_t>(cfg.observer.flow_idle_timeout_seconds * 1e9);
    opts.poll_budget = cfg.observer.poll_budget ? cfg.observer.poll_budget : 64;
    return opts;
}

Observer::Observer(ObserverOptions options,
                   HandlerChains chains,
                   RecordSink sink,
                   net::PacketSourcePtr source)
    : options_(std::move(options)),
      chains_(std::move(chains)),
      sink_(std::move(sink)),
      source_(std::move(source)) {
    PSLOG_DEBUG("Observer chains: %s", describe_chains(chains_).c_str());
}

std::unique_ptr<Observer> Observer::create(const Config& cfg,
                                           HandlerChains chains,
                                           RecordSink sink) {
    auto source = net::create_packet_source(cfg);
    if (!source) {
        throw ObserverError("no packet source available");
    }
    const auto& locator = cfg.observer.source;
    if (!source->open(locator)) {
        throw ObserverError("cannot open capture source '" + locator + "'");
    }
    return std::make_unique<Observer>(ObserverOptions::from_config(cfg),
                                      std::move(chains), std::move(sink), std::move(source));
}

bool Observer::is_local(const net::IpAddress& addr) const {
    for (const auto& local : options_.local_addresses) {
        if (local == addr) return true;
    }
    return false;
}

Observer::Oriented Observer::orient(const net::PacketView& pkt) const {
    const net::FlowKey src_local{pkt.src_ip, pkt.dst_ip, pkt.src_port, pkt.dst_port, pkt.protocol};
    const net::FlowKey dst_local{pkt.dst_ip, pkt.src_ip, pkt.dst_port, pkt.src_port, pkt.protocol};

    if (is_local(pkt.src_ip)) return {src_local, Direction::Outgoing};
    if (is_local(pkt.dst_ip)) return {dst_local, Direction::Incoming};

    // No configured address matched: whoever opened the flow is local.
    if (flows_.count(dst_local) || finished_.count(dst_local)) {
        return {dst_local, Direction::Incoming};
    }
    return {src_local, Direction::Outgoing};
}

uint64_t Observer::clock_ns() const {
    if (latest_packet_ns_ == 0) return wall_clock_ns();
    const auto since = std::chrono::steady_clock::now() - latest_packet_wall_;
    return latest_packet_ns_ +
           static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since).count());
}

void Observer::process_packet(const net::PacketView& pkt) {
    ++stats_.packets_seen;

    if ((!pkt.is_tcp() && !pkt.is_udp()) ||
        (pkt.ip_version != 4 && pkt.ip_version != 6) ||
        !options_.ports.matches(pkt.src_port, pkt.dst_port)) {
        ++stats_.packets_ignored;
        return;
    }

    if (pkt.timestamp_ns >= latest_packet_ns_) {
        latest_packet_ns_ = pkt.timestamp_ns;
        latest_packet_wall_ = std::chrono::steady_clock::now();
    }

    const auto [key, dir] = orient(pkt);

    auto it = flows_.find(key);
    if (it == flows_.end()) {
        auto done = finished_.find(key);
        if (done != finished_.end()) {
            const auto& flags = pkt.tcp.view_flags();
            const bool fresh_syn = pkt.is_tcp() && flags.syn && !flags.ack;
            if (!fresh_syn) {
                ++stats_.packets_ignored;
                return;
            }
            finished_.erase(done);
        }

        FlowContext ctx;
        ctx.key = key;
        if (!run_chain(chains_.new_flow, ctx, pkt, dir)) {
            ++stats_.packets_ignored;
            return;
        }
        it = flows_.emplace(key, std::move(ctx)).first;
        ++stats_.flows_created;
        PSLOG_DEBUG("New flow %s", net::flow_debug_details(key).c_str());
    }

    FlowContext& ctx = it->second;
    ctx.metrics.last_ns = pkt.timestamp_ns;

    auto& ip_chain = pkt.ip_version == 4 ? chains_.ip4 : chains_.ip6;
    if (!run_chain(ip_chain, ctx, pkt, dir)) {
        finalize(key, FinishReason::HandlerStop);
        return;
    }

    auto& l4_chain = pkt.is_tcp() ? chains_.tcp : chains_.udp;
    if (!run_chain(l4_chain, ctx, pkt, dir)) {
        finalize(key, FinishReason::HandlerStop);
    }
}

void Observer::finalize(const net::FlowKey& key, FinishReason reason) {
    auto it = flows_.find(key);
    if (it == flows_.end()) return;

    FlowRecord record = it->second.finalize(reason);
    flows_.erase(it);
    finished_[key] = record.metrics.last_ns;
    ++stats_.flows_emitted;

    PSLOG_DEBUG("Flow %s finished (%s)", net::flow_debug_details(key).c_str(), to_string(reason));
    if (sink_) {
        sink_(std::move(record));
    }
}

void Observer::expire_idle(uint64_t now_ns) {
    if (options_.idle_timeout_ns == 0 || now_ns < options_.idle_timeout_ns) return;
    const uint64_t cutoff = now_ns - options_.idle_timeout_ns;

    std::vector<net::FlowKey> idle;
    for (const auto& [key, ctx] : flows_) {
        if (ctx.metrics.last_ns < cutoff) idle.push_back(key);
    }
    for (const auto& key : idle) {
        finalize(key, FinishReason::Idle);
    }

    for (auto it = finished_.begin(); it != finished_.end();) {
        if (it->second < cutoff) {
            it = finished_.erase(it);
        } else {
            ++it;
        }
    }
}

void Observer::flush_all(FinishReason reason) {
    std::vector<net::FlowKey> keys;
    keys.reserve(flows_.size());
    for (const auto& kv : flows_) keys.push_back(kv.first);
    for (const auto& key : keys) {
        finalize(key, reason);
    }
}

void Observer::run(const std::atomic<bool>& stop) {
    if (!source_) {
        throw ObserverError("observer has no packet source");
    }

    const net::PacketHandler handler = [this](const net::PacketView& pkt) { process_packet(pkt); };
    auto next_expire = std::chrono::steady_clock::now() + kExpireInterval;
    bool drained = false;

    PSLOG_INFO("Observer running on %s", options_.locator.c_str());
    while (!stop.load(std::memory_order_acquire)) {
        if (source_->exhausted()) {
            if (!drained) {
                PSLOG_INFO("Capture source exhausted after %llu packets",
                           static_cast<unsigned long long>(stats_.packets_seen));
                flush_all(FinishReason::Shutdown);
                drained = true;
            }
            std::this_thread::sleep_for(kExhaustedSleep);
            continue;
        }

        if (!source_->poll(handler, options_.poll_budget)) {
            source_->close();
            throw ObserverError("capture failed on " + options_.locator);
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= next_expire) {
            expire_idle(clock_ns());
            next_expire = now + kExpireInterval;
        }
    }

    flush_all(FinishReason::Shutdown);
    source_->close();
    PSLOG_INFO("Observer stopped: %llu packets, %llu flows",
               static_cast<unsigned long long>(stats_.packets_seen),
               static_cast<unsigned long long>(stats_.flows_emitted));
}

} // namespace pathspider::observer
