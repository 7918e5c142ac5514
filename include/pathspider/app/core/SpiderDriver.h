// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/config/Config.h"
#include "pathspider/spider/Environment.h"
#include "pathspider/spider/Plugin.h"
#include "pathspider/spider/Scheduler.h"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace pathspider {

/**
 * @brief Configuration for a single measurement run.
 */
struct DriverOptions {
    std::istream* input = nullptr;      // CSV job rows; required.
    std::ostream* output = nullptr;     // JSON lines sink; required.
    std::function<bool()> should_stop;  // Cooperative cancellation callback.
    spider::EnvironmentSetup* environment = nullptr; // nullptr: chosen from cfg.environment.enabled.
};

/**
 * @brief Execution summary of a run.
 */
struct RunSummary {
    std::string plugin;
    uint64_t jobs_read = 0;
    uint64_t attempts = 0;
    uint64_t connections_ok = 0;
    uint64_t connections_failed = 0;
    uint64_t connections_timeout = 0;
    uint64_t exchange_errors = 0;
    uint64_t records_written = 0;
    uint64_t records_observed = 0;
    uint64_t packets_seen = 0;
    uint64_t packets_ignored = 0;
    uint64_t flows_emitted = 0;
    uint64_t flows_discarded = 0;
    bool stopped = false;               // Ended by should_stop rather than input exhaustion.
};

/// Scheduler settings from @p cfg, falling back to the plugin's defaults.
spider::SchedulerOptions scheduler_options_for(const Config& cfg, const spider::Plugin& plugin);

/**
 * @brief Run @p plugin over every job in the input under both configurations.
 *
 * The observer is created before any thread starts; observer, correlator,
 * writer, scheduler and job feeder then run on their own threads until the
 * writer has seen the terminal marker.
 *
 * @throws ObserverError when capture cannot start or fails mid-run.
 * @throws EnvironmentSetupError when a configuration cannot be applied.
 * @throws JobFormatError when the job input is malformed. Jobs read before
 *         the bad row are still measured and written.
 */
RunSummary run_spider(const Config& cfg, spider::Plugin& plugin, const DriverOptions& opts);

/// Boxed, human readable rendering of @p summary.
void print_run_summary(std::ostream& out, const RunSummary& summary);

} // namespace pathspider
