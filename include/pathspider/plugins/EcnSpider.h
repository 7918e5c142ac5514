// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Plugin.h"

namespace pathspider::plugins {

/**
 * @brief ECN connectivity: HTTP GET with ECN negotiation off (config 0) and on (config 1).
 */
class EcnSpider : public spider::Plugin {
public:
    std::string name() const override { return "ecn"; }
    std::string description() const override {
        return "Explicit Congestion Notification: tcp_ecn=2 vs. tcp_ecn=1";
    }

    spider::CommandList environment_commands(int config) const override;
    spider::Connection connect(const spider::Job& job, int config,
                               std::chrono::milliseconds timeout) override;
    spider::ActiveRecord post_connect(const spider::Job& job, spider::Connection& conn,
                                      int config, std::chrono::milliseconds timeout) override;
    observer::HandlerChains flow_handlers() const override;
    nlohmann::json flow_features(const observer::FlowRecord& flow) const override;
};

/// Flag word "f?f/f?r" layout: TCP flags in the low byte, ECN codepoints seen in the high byte.
uint16_t merged_flag_word(uint8_t tcp_flags, uint8_t ecn_seen);

} // namespace pathspider::plugins
