// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Plugin.h"

namespace pathspider::plugins {

/**
 * @brief TCP Fast Open reachability.
 *
 * Config 0 connects normally. Config 1 first opens a connection that only
 * requests a cookie, then a second one whose SYN carries the HTTP request.
 */
class TfoSpider : public spider::Plugin {
public:
    std::string name() const override { return "tfo"; }
    std::string description() const override {
        return "TCP Fast Open: plain connect vs. cookie-bearing SYN with data";
    }
    // Two handshakes per attempt under config 1.
    std::chrono::milliseconds default_conn_timeout() const override {
        return std::chrono::milliseconds(10000);
    }

    spider::CommandList environment_commands(int config) const override;
    spider::Connection connect(const spider::Job& job, int config,
                               std::chrono::milliseconds timeout) override;
    spider::ActiveRecord post_connect(const spider::Job& job, spider::Connection& conn,
                                      int config, std::chrono::milliseconds timeout) override;
    observer::HandlerChains flow_handlers() const override;
    nlohmann::json flow_features(const observer::FlowRecord& flow) const override;
};

} // namespace pathspider::plugins
