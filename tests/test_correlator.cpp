// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Correlator.h"

#include <cassert>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

using namespace pathspider;
using spider::ActiveRecord;
using spider::MergedRecord;
using observer::FlowRecord;

namespace {

const auto kLocal = *net::IpAddress::parse("192.0.2.1");
const auto kRemote = *net::IpAddress::parse("198.51.100.7");

ActiveRecord active(uint16_t local_port, int config) {
    ActiveRecord rec;
    rec.remote_ip = kRemote;
    rec.remote_port = 80;
    rec.local_port = local_port;
    rec.config = config;
    rec.state = spider::ConnectionState::Ok;
    rec.result = 200;
    return rec;
}

FlowRecord flow(uint16_t local_port, uint64_t packets) {
    FlowRecord rec;
    rec.key = net::FlowKey{kLocal, kRemote, local_port, 80, net::kProtoTcp};
    rec.metrics.outgoing.packets = packets;
    return rec;
}

MergedRecord merge(const observer::FlowObservation& obs, const ActiveRecord& a) {
    MergedRecord out;
    out.active = a;
    if (const auto* f = std::get_if<FlowRecord>(&obs)) out.flow = *f;
    return out;
}

std::vector<MergedRecord> drain(Stream<MergedRecord>& output) {
    std::vector<MergedRecord> out;
    for (;;) {
        auto item = output.pop();
        if (is_end_of_stream(item)) break;
        out.push_back(std::get<MergedRecord>(std::move(item)));
    }
    return out;
}

} // namespace

int main() {
    using namespace std::chrono_literals;

    // An active record nothing was observed for comes out unobserved after the grace period.
    {
        Stream<ActiveRecord> actives;
        Stream<FlowRecord> flows;
        Stream<MergedRecord> output;
        actives.push(active(40000, 0));
        actives.push(EndOfStream{});

        spider::Correlator correlator(actives, flows, output, merge, 50ms);
        const auto start = std::chrono::steady_clock::now();
        correlator.run();
        assert(std::chrono::steady_clock::now() - start >= 50ms);

        auto merged = drain(output);
        assert(merged.size() == 1);
        assert(!merged[0].observed());
        assert(merged[0].active.local_port == 40000);
        assert(correlator.stats().merged_unobserved == 1);
    }

    // Two connections, flows arriving before and after their active records:
    // each merges with its own flow only.
    {
        Stream<ActiveRecord> actives;
        Stream<FlowRecord> flows;
        Stream<MergedRecord> output;

        flows.push(flow(41002, 22));          // early for P2
        actives.push(active(41001, 0));
        actives.push(active(41002, 0));
        actives.push(EndOfStream{});
        flows.push(flow(49999, 5));           // nobody will claim this one

        spider::Correlator correlator(actives, flows, output, merge, 2s);
        std::thread late([&flows]() {
            std::this_thread::sleep_for(30ms);
            flows.push(flow(41001, 11));      // late for P1
            flows.push(EndOfStream{});
        });
        correlator.run();
        late.join();

        auto merged = drain(output);
        assert(merged.size() == 2);
        std::map<uint16_t, uint64_t> packets_by_port;
        for (const auto& m : merged) {
            assert(m.observed());
            assert(m.flow->key.local_port == m.active.local_port);
            packets_by_port[m.active.local_port] = m.flow->metrics.outgoing.packets;
        }
        assert(packets_by_port[41001] == 11);
        assert(packets_by_port[41002] == 22);
        assert(correlator.stats().merged_observed == 2);
        assert(correlator.stats().flows_discarded == 1);
    }

    // The same connection key seen twice (port reuse across phases) matches FIFO.
    {
        Stream<ActiveRecord> actives;
        Stream<FlowRecord> flows;
        Stream<MergedRecord> output;

        flows.push(flow(42000, 1));
        flows.push(flow(42000, 2));
        flows.push(EndOfStream{});
        actives.push(active(42000, 0));
        actives.push(active(42000, 1));
        actives.push(EndOfStream{});

        spider::Correlator correlator(actives, flows, output, merge, 1s);
        correlator.run();
        auto merged = drain(output);
        assert(merged.size() == 2);
        for (const auto& m : merged) {
            assert(m.observed());
            assert(m.flow->metrics.outgoing.packets == static_cast<uint64_t>(m.active.config + 1));
        }
    }

    // Flow stream ending early cuts the grace period short.
    {
        Stream<ActiveRecord> actives;
        Stream<FlowRecord> flows;
        Stream<MergedRecord> output;
        flows.push(EndOfStream{});
        actives.push(active(43000, 1));
        actives.push(EndOfStream{});

        spider::Correlator correlator(actives, flows, output, merge, 10s);
        const auto start = std::chrono::steady_clock::now();
        correlator.run();
        assert(std::chrono::steady_clock::now() - start < 5s);
        auto merged = drain(output);
        assert(merged.size() == 1);
        assert(!merged[0].observed());
    }

    // Waiting on the flow stream: a flow flushed well past the grace period,
    // but before the stream ends, still merges.
    {
        Stream<ActiveRecord> actives;
        Stream<FlowRecord> flows;
        Stream<MergedRecord> output;
        actives.push(active(44000, 0));
        actives.push(EndOfStream{});

        spider::Correlator correlator(actives, flows, output, merge, 10ms,
                                      spider::Correlator::GraceMode::UntilFlowsEnd);
        std::thread flusher([&flows]() {
            std::this_thread::sleep_for(150ms);
            flows.push(flow(44000, 3));
            flows.push(flow(44001, 1));
            flows.push(EndOfStream{});
        });
        correlator.run();
        flusher.join();

        auto merged = drain(output);
        assert(merged.size() == 1);
        assert(merged[0].observed());
        assert(merged[0].flow->metrics.outgoing.packets == 3);
        assert(correlator.stats().flows_discarded == 1);
    }

    return 0;
}
