// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Environment.h"
#include "pathspider/spider/Plugin.h"
#include "pathspider/util/BlockingQueue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace pathspider::spider {

struct SchedulerOptions {
    unsigned worker_count{100};
    std::chrono::milliseconds conn_timeout{5000};
    /// Per-config overrides of the plugin's environment commands (empty = plugin default).
    CommandList config_zero{};
    CommandList config_one{};
};

struct SchedulerStats {
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> ok{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> timeout{0};
    std::atomic<uint64_t> exchange_errors{0};
};

/**
 * @brief Two-phase worker pool.
 *
 * Phase 0 consumes jobs as they are added; every dispatched job is
 * remembered and replayed under configuration 1 once input has ended and
 * phase 0 has drained. Each attempt yields exactly one ActiveRecord on the
 * output stream; EndOfStream follows the last one.
 */
class Scheduler {
public:
    Scheduler(Plugin& plugin,
              EnvironmentSetup& environment,
              Stream<ActiveRecord>& output,
              SchedulerOptions options);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Queue a job for phase 0. Safe from any thread.
    void add_job(Job job);

    /// End of input: phase 0 finishes once the queue is drained.
    void shutdown();

    /**
     * @brief Run both phases, then send EndOfStream. Blocks.
     *
     * @param should_stop polled between jobs; once true no further job is
     *        dispatched and phase 1 is skipped.
     * @throws EnvironmentSetupError when a phase cannot be configured. The
     *         terminal signal is sent before the exception leaves.
     */
    void run(const std::function<bool()>& should_stop = {});

    /**
     * @brief Configure for @p config and push every job in @p jobs through the pool.
     */
    void run_phase(const std::vector<Job>& jobs, int config,
                   const std::function<bool()>& should_stop = {});

    const SchedulerStats& stats() const noexcept { return stats_; }

private:
    void setup_environment(int config);
    void run_workers(Stream<Job>& queue, int config, bool remember,
                     const std::function<bool()>& should_stop);
    void worker_loop(Stream<Job>& queue, int config, bool remember,
                     const std::function<bool()>& should_stop);
    ActiveRecord attempt(const Job& job, int config);

    Plugin& plugin_;
    EnvironmentSetup& environment_;
    Stream<ActiveRecord>& output_;
    SchedulerOptions options_;

    Stream<Job> input_;
    std::mutex dispatched_mtx_;
    std::vector<Job> dispatched_;
    SchedulerStats stats_{};
};

} // namespace pathspider::spider
