// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/plugins/EcnSpider.h"

#include "pathspider/observer/Handlers.h"
#include "pathspider/plugins/HttpExchange.h"
#include "pathspider/plugins/Sockets.h"

namespace pathspider::plugins {

uint16_t merged_flag_word(uint8_t tcp_flags, uint8_t ecn_seen) {
    return static_cast<uint16_t>(tcp_flags | (static_cast<uint16_t>(ecn_seen) << 8));
}

spider::CommandList EcnSpider::environment_commands(int config) const {
    const char* value = config == 0 ? "net.ipv4.tcp_ecn=2" : "net.ipv4.tcp_ecn=1";
    return {{"sysctl", "-w", value}};
}

spider::Connection EcnSpider::connect(const spider::Job& job, int,
                                      std::chrono::milliseconds timeout) {
    return tcp_connect(job, timeout);
}

spider::ActiveRecord EcnSpider::post_connect(const spider::Job& job, spider::Connection& conn,
                                             int config, std::chrono::milliseconds timeout) {
    spider::ActiveRecord rec = spider::make_active_record(job, conn, config);
    if (conn.ok()) {
        rec.result = http_exchange(conn.socket.get(), build_http_request(job), 0, timeout);
    }
    conn.close();
    return rec;
}

observer::HandlerChains EcnSpider::flow_handlers() const {
    observer::HandlerChains chains;
    chains.new_flow.push_back(std::make_unique<observer::BasicFlowHandler>());
    chains.ip4.push_back(std::make_unique<observer::BasicCountHandler>());
    chains.ip4.push_back(std::make_unique<observer::EcnMarksHandler>());
    chains.ip6.push_back(std::make_unique<observer::BasicCountHandler>());
    chains.ip6.push_back(std::make_unique<observer::EcnMarksHandler>());
    chains.tcp.push_back(std::make_unique<observer::TcpFlagsHandler>());
    chains.tcp.push_back(std::make_unique<observer::TcpCompletedHandler>());
    return chains;
}

nlohmann::json EcnSpider::flow_features(const observer::FlowRecord& flow) const {
    const auto& fwd = flow.metrics.outgoing;
    const auto& rev = flow.metrics.incoming;

    // SYN with ECE|CWR answered by a SYN-ACK with ECE only.
    const bool syn_requested = (fwd.syn_flags & (net::kTcpEce | net::kTcpCwr)) ==
                               (net::kTcpEce | net::kTcpCwr);
    const bool synack_agreed = (rev.syn_flags & (net::kTcpEce | net::kTcpCwr)) == net::kTcpEce;

    return nlohmann::json{
        {"fif", fwd.initial_flags},
        {"fsf", merged_flag_word(fwd.syn_flags, fwd.syn_ecn_seen)},
        {"fuf", merged_flag_word(fwd.union_flags, fwd.ecn_seen)},
        {"fir", rev.initial_flags},
        {"fsr", merged_flag_word(rev.syn_flags, rev.syn_ecn_seen)},
        {"fur", merged_flag_word(rev.union_flags, rev.ecn_seen)},
        {"ecn_negotiated", syn_requested && synack_agreed},
        {"fwd_ect0", fwd.ect0}, {"fwd_ect1", fwd.ect1}, {"fwd_ce", fwd.ce},
        {"rev_ect0", rev.ect0}, {"rev_ect1", rev.ect1}, {"rev_ce", rev.ce},
    };
}

} // namespace pathspider::plugins
