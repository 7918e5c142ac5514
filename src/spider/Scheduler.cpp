// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Scheduler.h"

#include "pathspider/Errors.h"
#include "pathspider/log/Log.h"

#include <exception>
#include <thread>

namespace pathspider::spider {

namespace {

constexpr auto kStopCheckInterval = std::chrono::milliseconds(100);

bool stop_requested(const std::function<bool()>& should_stop) {
    return should_stop && should_stop();
}

} // namespace

Scheduler::Scheduler(Plugin& plugin,
                     EnvironmentSetup& environment,
                     Stream<ActiveRecord>& output,
                     SchedulerOptions options)
    : plugin_(plugin),
      environment_(environment),
      output_(output),
      options_(std::move(options)) {
    if (options_.worker_count == 0) {
        options_.worker_count = 1;
    }
}

void Scheduler::add_job(Job job) {
    input_.push(std::move(job));
}

void Scheduler::shutdown() {
    input_.push(EndOfStream{});
}

void Scheduler::setup_environment(int config) {
    const auto& override_cmds = config == 0 ? options_.config_zero : options_.config_one;
    const CommandList commands = override_cmds.empty() ? plugin_.environment_commands(config)
                                                       : override_cmds;
    PSLOG_INFO("Configuring environment for config %d", config);
    environment_.apply(config, commands);
}

void Scheduler::run(const std::function<bool()>& should_stop) {
    try {
        setup_environment(0);
        PSLOG_INFO("Phase 0 running with %u workers", options_.worker_count);
        run_workers(input_, 0, true, should_stop);

        if (!stop_requested(should_stop)) {
            std::vector<Job> replay;
            {
                std::lock_guard<std::mutex> lk(dispatched_mtx_);
                replay = dispatched_;
            }
            PSLOG_INFO("Phase 0 done, replaying %zu jobs under config 1", replay.size());
            run_phase(replay, 1, should_stop);
        } else {
            PSLOG_WARN("Stop requested, skipping remaining jobs");
        }
    } catch (const EnvironmentSetupError& ex) {
        PSLOG_ERROR("Environment setup failed: %s", ex.what());
        output_.push(EndOfStream{});
        throw;
    }

    output_.push(EndOfStream{});
    PSLOG_INFO("Scheduler finished: %llu attempts (%llu ok, %llu failed, %llu timeout)",
               static_cast<unsigned long long>(stats_.dispatched.load()),
               static_cast<unsigned long long>(stats_.ok.load()),
               static_cast<unsigned long long>(stats_.failed.load()),
               static_cast<unsigned long long>(stats_.timeout.load()));
}

void Scheduler::run_phase(const std::vector<Job>& jobs, int config,
                          const std::function<bool()>& should_stop) {
    setup_environment(config);

    Stream<Job> queue;
    for (const auto& job : jobs) {
        queue.push(job);
    }
    queue.push(EndOfStream{});
    run_workers(queue, config, false, should_stop);
}

void Scheduler::run_workers(Stream<Job>& queue, int config, bool remember,
                            const std::function<bool()>& should_stop) {
    std::vector<std::thread> workers;
    workers.reserve(options_.worker_count);
    for (unsigned i = 0; i < options_.worker_count; ++i) {
        workers.emplace_back([this, &queue, config, remember, &should_stop] {
            worker_loop(queue, config, remember, should_stop);
        });
    }
    for (auto& t : workers) {
        t.join();
    }
}

void Scheduler::worker_loop(Stream<Job>& queue, int config, bool remember,
                            const std::function<bool()>& should_stop) {
    for (;;) {
        if (stop_requested(should_stop)) {
            return;
        }
        auto item = queue.pop_for(kStopCheckInterval);
        if (!item) {
            continue;
        }
        if (is_end_of_stream(*item)) {
            // Leave the marker for the other workers.
            queue.push(EndOfStream{});
            return;
        }

        Job job = std::get<Job>(std::move(*item));
        if (remember) {
            std::lock_guard<std::mutex> lk(dispatched_mtx_);
            dispatched_.push_back(job);
        }
        output_.push(attempt(job, config));
    }
}

ActiveRecord Scheduler::attempt(const Job& job, int config) {
    ++stats_.dispatched;

    Connection conn;
    try {
        conn = plugin_.connect(job, config, options_.conn_timeout);
    } catch (const std::exception& ex) {
        PSLOG_DEBUG("connect %s failed: %s", job.describe().c_str(), ex.what());
        conn = Connection{};
        conn.state = ConnectionState::Failed;
    } catch (...) {
        PSLOG_WARN("connect %s threw a non-standard exception", job.describe().c_str());
        conn = Connection{};
        conn.state = ConnectionState::Failed;
    }

    switch (conn.state) {
        case ConnectionState::Ok:      ++stats_.ok; break;
        case ConnectionState::Failed:  ++stats_.failed; break;
        case ConnectionState::Timeout: ++stats_.timeout; break;
    }

    ActiveRecord rec;
    try {
        rec = plugin_.post_connect(job, conn, config, options_.conn_timeout);
    } catch (const std::exception& ex) {
        ++stats_.exchange_errors;
        PSLOG_DEBUG("exchange with %s failed: %s", job.describe().c_str(), ex.what());
        rec = make_active_record(job, conn, config);
        rec.result = 0;
    } catch (...) {
        ++stats_.exchange_errors;
        PSLOG_WARN("exchange with %s threw a non-standard exception", job.describe().c_str());
        rec = make_active_record(job, conn, config);
        rec.result = 0;
    }
    conn.close();

    PSLOG_TRACE("config %d %s -> %s (local port %u, result %d)", config, job.describe().c_str(),
                to_string(rec.state), static_cast<unsigned>(rec.local_port), rec.result);
    return rec;
}

} // namespace pathspider::spider
