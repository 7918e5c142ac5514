// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/plugins/TfoSpider.h"

#include "pathspider/log/Log.h"
#include "pathspider/observer/Handlers.h"
#include "pathspider/plugins/HttpExchange.h"
#include "pathspider/plugins/Sockets.h"

namespace pathspider::plugins {

spider::CommandList TfoSpider::environment_commands(int config) const {
    // 1 = client side only; the cookie cache lives across both phases.
    const char* value = config == 0 ? "net.ipv4.tcp_fastopen=0" : "net.ipv4.tcp_fastopen=1";
    return {{"sysctl", "-w", value}};
}

spider::Connection TfoSpider::connect(const spider::Job& job, int config,
                                      std::chrono::milliseconds timeout) {
    if (config == 0) {
        return tcp_connect(job, timeout);
    }

    const std::string request = build_http_request(job);

    // Step one: the SYN asks for a cookie; the connection itself is thrown away.
    {
        spider::Connection cookie_conn = tcp_fastopen_connect(job, request, timeout);
        if (!cookie_conn.ok()) {
            PSLOG_DEBUG("cookie request to %s: %s", job.describe().c_str(),
                        spider::to_string(cookie_conn.state));
        }
        cookie_conn.close();
    }

    // Step two: the SYN carries the cookie and the request.
    return tcp_fastopen_connect(job, request, timeout);
}

spider::ActiveRecord TfoSpider::post_connect(const spider::Job& job, spider::Connection& conn,
                                             int config, std::chrono::milliseconds timeout) {
    spider::ActiveRecord rec = spider::make_active_record(job, conn, config);
    if (conn.ok()) {
        const std::size_t already = config == 1 ? conn.bytes_sent : 0;
        rec.result = http_exchange(conn.socket.get(), build_http_request(job), already, timeout);
    }
    conn.close();
    return rec;
}

observer::HandlerChains TfoSpider::flow_handlers() const {
    observer::HandlerChains chains;
    chains.new_flow.push_back(std::make_unique<observer::BasicFlowHandler>());
    chains.new_flow.push_back(std::make_unique<observer::TfoSetupHandler>());
    chains.ip4.push_back(std::make_unique<observer::BasicCountHandler>());
    chains.ip6.push_back(std::make_unique<observer::BasicCountHandler>());
    chains.tcp.push_back(std::make_unique<observer::TcpFlagsHandler>());
    chains.tcp.push_back(std::make_unique<observer::TfoProgressHandler>());
    chains.tcp.push_back(std::make_unique<observer::TcpCompletedHandler>());
    return chains;
}

nlohmann::json TfoSpider::flow_features(const observer::FlowRecord& flow) const {
    const auto& tfo = flow.metrics.tfo;
    return nlohmann::json{
        {"tfostate", observer::to_string(tfo.state)},
        {"tfo_seq", tfo.seq},
        {"tfo_len", tfo.len},
    };
}

} // namespace pathspider::plugins
