// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/observer/FlowHandler.h"
#include "pathspider/spider/Environment.h"
#include "pathspider/spider/Records.h"

#include <chrono>
#include <string>

namespace pathspider::spider {

/**
 * @brief A measurement: two configurations, how to connect under each, which
 *        flow handlers observe the connections and how results are merged.
 *
 * connect() and post_connect() run concurrently on worker threads and must
 * not share unsynchronised state.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    /// Pool size and connect timeout used unless the config or command line sets them.
    virtual unsigned default_worker_count() const { return 100; }
    virtual std::chrono::milliseconds default_conn_timeout() const {
        return std::chrono::milliseconds(5000);
    }

    /// Default commands for configuration 0 or 1; the config file may override them.
    virtual CommandList environment_commands(int config) const = 0;

    /**
     * @brief Open a connection for @p job under @p config within @p timeout.
     *
     * Failures are reported in Connection::state; exceptions are treated as
     * Failed by the scheduler.
     */
    virtual Connection connect(const Job& job, int config, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Run the protocol exchange and build the active record.
     *
     * Also called for failed connects so every attempt yields one record.
     * Must leave @p conn closed on return.
     */
    virtual ActiveRecord post_connect(const Job& job,
                                      Connection& conn,
                                      int config,
                                      std::chrono::milliseconds timeout) = 0;

    /// Fresh handler chains for one observer instance.
    virtual observer::HandlerChains flow_handlers() const = 0;

    /// Plugin-specific fields added to an observed record.
    virtual nlohmann::json flow_features(const observer::FlowRecord& flow) const;

    /// Combine an active record with what the observer saw (or did not see).
    virtual MergedRecord merge(const observer::FlowObservation& flow, const ActiveRecord& active) const;
};

} // namespace pathspider::spider
