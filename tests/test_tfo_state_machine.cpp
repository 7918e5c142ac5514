// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/observer/Observer.h"
#include "pathspider/plugins/TfoSpider.h"

#include <cassert>
#include <cstdint>
#include <vector>

using namespace pathspider;
using observer::FlowRecord;
using observer::TfoState;

namespace {

const uint8_t kCookieOpt[] = {34, 10, 1, 2, 3, 4, 5, 6, 7, 8};
const uint8_t kRequestOpt[] = {34, 2, 1, 1};

const auto kClient = *net::IpAddress::parse("192.0.2.10");
const auto kServer = *net::IpAddress::parse("198.51.100.20");

net::PacketView segment(bool outgoing, uint32_t seq, uint32_t ack, uint8_t flags,
                        uint64_t payload, const uint8_t* opts, std::size_t opts_len,
                        uint64_t ts) {
    net::PacketView pkt{};
    pkt.ip_version = 4;
    pkt.protocol = net::kProtoTcp;
    pkt.src_ip = outgoing ? kClient : kServer;
    pkt.dst_ip = outgoing ? kServer : kClient;
    pkt.src_port = outgoing ? 40000 : 80;
    pkt.dst_port = outgoing ? 80 : 40000;
    pkt.tcp.seq = seq;
    pkt.tcp.ack = ack;
    pkt.tcp.flags = flags;
    pkt.tcp.options = opts;
    pkt.tcp.options_length = opts_len;
    pkt.payload_bytes = payload;
    pkt.ip_length = static_cast<uint16_t>(40 + opts_len + payload);
    pkt.timestamp_ns = ts;
    return pkt;
}

struct Harness {
    std::vector<FlowRecord> records;
    observer::Observer obs;

    Harness()
        : obs(make_options(), plugins::TfoSpider().flow_handlers(),
              [this](FlowRecord rec) { records.push_back(std::move(rec)); }) {}

    static observer::ObserverOptions make_options() {
        observer::ObserverOptions opts;
        opts.local_addresses.push_back(kClient);
        return opts;
    }
};

} // namespace

int main() {
    // Data-bearing SYN acknowledged in full: ACKED and the flow completes.
    {
        Harness h;
        h.obs.process_packet(segment(true, 1000, 0, net::kTcpSyn, 4, kCookieOpt, sizeof(kCookieOpt), 1));
        assert(h.obs.open_flows() == 1);
        h.obs.process_packet(segment(false, 5000, 1005, net::kTcpSyn | net::kTcpAck, 0, nullptr, 0, 2));

        assert(h.records.size() == 1);
        const auto& rec = h.records.front();
        assert(rec.metrics.tfo.state == TfoState::Acked);
        assert(rec.metrics.tfo.seq == 1000);
        assert(rec.metrics.tfo.len == 4);
        assert(rec.reason == observer::FinishReason::HandlerStop);
        assert(rec.key.local_port == 40000);
        assert(rec.key.remote_ip == kServer);
        assert(h.obs.open_flows() == 0);
    }

    // SYN/ACK acknowledging only the SYN: data was not accepted, stays DATA_SENT.
    {
        Harness h;
        h.obs.process_packet(segment(true, 1000, 0, net::kTcpSyn, 4, kCookieOpt, sizeof(kCookieOpt), 1));
        h.obs.process_packet(segment(false, 5000, 1001, net::kTcpSyn | net::kTcpAck, 0, nullptr, 0, 2));
        assert(h.records.empty());
        h.obs.flush_all(observer::FinishReason::Shutdown);
        assert(h.records.size() == 1);
        assert(h.records.front().metrics.tfo.state == TfoState::DataSent);
        assert(h.records.front().reason == observer::FinishReason::Shutdown);
    }

    // Retransmission at the same sequence number without a cookie: FALLBACK.
    {
        Harness h;
        h.obs.process_packet(segment(true, 1000, 0, net::kTcpSyn, 4, kCookieOpt, sizeof(kCookieOpt), 1));
        h.obs.process_packet(segment(true, 1000, 0, net::kTcpSyn, 0, nullptr, 0, 2));
        h.obs.process_packet(segment(false, 5000, 1001, net::kTcpSyn | net::kTcpAck, 0, nullptr, 0, 3));
        assert(h.records.empty());
        // Regular handshake continues until FIN.
        h.obs.process_packet(segment(true, 1001, 5001, net::kTcpAck, 4, nullptr, 0, 4));
        h.obs.process_packet(segment(true, 1005, 5001, net::kTcpFin | net::kTcpAck, 0, nullptr, 0, 5));

        assert(h.records.size() == 1);
        const auto& rec = h.records.front();
        assert(rec.metrics.tfo.state == TfoState::Fallback);
        assert(rec.metrics.tfo.seq == observer::kTfoSeqFallback);
        assert(rec.metrics.tfo.len == observer::kTfoSeqFallback);
    }

    // Cookie request: the server's SYN/ACK carries a cookie.
    {
        Harness h;
        h.obs.process_packet(segment(true, 300, 0, net::kTcpSyn, 0, kRequestOpt, sizeof(kRequestOpt), 1));
        h.obs.process_packet(segment(false, 900, 301, net::kTcpSyn | net::kTcpAck, 0,
                                     kCookieOpt, sizeof(kCookieOpt), 2));
        h.obs.flush_all(observer::FinishReason::Shutdown);
        assert(h.records.size() == 1);
        const auto& rec = h.records.front();
        assert(rec.metrics.tfo.state == TfoState::CookieRequested);
        assert(rec.metrics.tfo.seq == observer::kTfoSeqUnset);

        // Features exported for the merged record.
        const auto features = plugins::TfoSpider().flow_features(rec);
        assert(features.at("tfostate") == "cookie_requested");
    }

    return 0;
}
