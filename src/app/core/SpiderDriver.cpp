// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/app/core/SpiderDriver.h"

#include "pathspider/Errors.h"
#include "pathspider/io/JobReader.h"
#include "pathspider/io/ResultWriter.h"
#include "pathspider/log/Log.h"
#include "pathspider/observer/Observer.h"
#include "pathspider/spider/Correlator.h"
#include "pathspider/spider/Scheduler.h"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace pathspider {
namespace {

constexpr auto kGraceStep = std::chrono::milliseconds(20);

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

// Let late packets of in-flight connections reach the observer.
void wait_grace_period(std::chrono::milliseconds grace, const std::atomic<bool>& observer_failed) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline &&
           !observer_failed.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(kGraceStep);
    }
}

// State shared with the job feeder. The feeder may still be blocked on its
// input when a stop is requested, in which case it is detached and this
// outlives the run.
struct FeederState {
    std::shared_ptr<spider::Scheduler> scheduler;
    std::atomic<uint64_t> jobs_read{0};
    std::atomic<bool> done{false};
    std::exception_ptr error;
};

void feed_jobs(std::shared_ptr<FeederState> state,
               std::istream* input,
               std::function<bool()> should_stop) {
    try {
        io::JobReader reader(*input);
        while (!(should_stop && should_stop())) {
            auto job = reader.next();
            if (!job) break;
            PSLOG_TRACE("Job %s", job->describe().c_str());
            state->scheduler->add_job(std::move(*job));
            state->jobs_read.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const JobFormatError& ex) {
        PSLOG_ERROR("Job input rejected at line %zu: %s", ex.line(), ex.what());
        state->error = std::current_exception();
    }
    state->scheduler->shutdown();
    state->done.store(true, std::memory_order_release);
}

} // namespace

spider::SchedulerOptions scheduler_options_for(const Config& cfg, const spider::Plugin& plugin) {
    spider::SchedulerOptions opts;
    opts.worker_count = cfg.spider.worker_count.value_or(plugin.default_worker_count());
    opts.conn_timeout = cfg.spider.conn_timeout_seconds
        ? seconds_to_ms(*cfg.spider.conn_timeout_seconds)
        : plugin.default_conn_timeout();
    opts.config_zero = cfg.environment.config_zero;
    opts.config_one = cfg.environment.config_one;
    return opts;
}

/**
 * @brief Wire observer, correlator, writer, scheduler and feeder together.
 *
 * Shutdown order:
 *   - the feeder ends input, the scheduler finishes both phases and ends
 *     the active stream;
 *   - the observer keeps capturing for the grace period, is then stopped,
 *     flushes its open flows and the flow stream is ended;
 *   - the correlator matches what is left, ends the merged stream on flow EOS;
 *   - the writer drains it.
 */
RunSummary run_spider(const Config& cfg, spider::Plugin& plugin, const DriverOptions& opts) {
    if (!opts.input || !opts.output) {
        throw std::invalid_argument("run_spider needs both an input and an output stream");
    }

    RunSummary summary;
    summary.plugin = plugin.name();

    Stream<observer::FlowRecord> flows;
    Stream<spider::ActiveRecord> actives;
    Stream<spider::MergedRecord> merged;

    // Capture must be up before the first connection attempt, so this throws here.
    auto obs = observer::Observer::create(
        cfg, plugin.flow_handlers(),
        [&flows](observer::FlowRecord rec) { flows.push(std::move(rec)); });

    std::atomic<bool> observer_stop{false};
    auto observer_failed = std::make_shared<std::atomic<bool>>(false);
    std::exception_ptr observer_error;
    std::thread observer_thread([&]() {
        try {
            obs->run(observer_stop);
        } catch (const ObserverError& ex) {
            PSLOG_ERROR("Observer failed: %s", ex.what());
            observer_error = std::current_exception();
            observer_failed->store(true, std::memory_order_release);
        }
    });

    const auto user_should_stop = opts.should_stop;
    // Copied into the feeder, so it must not refer to locals of this frame.
    const std::function<bool()> should_stop = [observer_failed, user_should_stop]() {
        if (observer_failed->load(std::memory_order_acquire)) return true;
        return user_should_stop ? user_should_stop() : false;
    };

    spider::CommandEnvironment command_env;
    spider::NoopEnvironment noop_env;
    spider::EnvironmentSetup* environment = opts.environment;
    if (!environment) {
        environment = cfg.environment.enabled
            ? static_cast<spider::EnvironmentSetup*>(&command_env)
            : static_cast<spider::EnvironmentSetup*>(&noop_env);
    }

    const spider::SchedulerOptions sched_opts = scheduler_options_for(cfg, plugin);
    auto scheduler = std::make_shared<spider::Scheduler>(plugin, *environment, actives, sched_opts);

    const auto grace = seconds_to_ms(cfg.spider.grace_period_seconds);
    spider::Correlator correlator(
        actives, flows, merged,
        [&plugin](const observer::FlowObservation& flow, const spider::ActiveRecord& active) {
            return plugin.merge(flow, active);
        },
        grace, spider::Correlator::GraceMode::UntilFlowsEnd);
    std::thread correlator_thread([&correlator]() { correlator.run(); });

    io::ResultWriter writer(*opts.output);
    std::thread writer_thread([&writer, &merged]() { writer.run(merged); });

    std::exception_ptr scheduler_error;
    std::thread scheduler_thread([&]() {
        try {
            scheduler->run(should_stop);
        } catch (const EnvironmentSetupError& ex) {
            PSLOG_ERROR("Environment setup failed: %s", ex.what());
            scheduler_error = std::current_exception();
        }
    });

    auto feeder = std::make_shared<FeederState>();
    feeder->scheduler = scheduler;
    std::thread feeder_thread(feed_jobs, feeder, opts.input, should_stop);

    PSLOG_INFO("Running plugin %s with %u workers, %lld ms connect timeout",
               summary.plugin.c_str(), sched_opts.worker_count,
               static_cast<long long>(sched_opts.conn_timeout.count()));

    scheduler_thread.join();

    wait_grace_period(grace, *observer_failed);
    observer_stop.store(true, std::memory_order_release);
    observer_thread.join();
    flows.push(EndOfStream{});

    correlator_thread.join();
    writer_thread.join();

    summary.stopped = should_stop();
    // Without a stop the scheduler only ends after the feeder's shutdown().
    if (!summary.stopped || feeder->done.load(std::memory_order_acquire)) {
        feeder_thread.join();
    } else {
        // Still blocked reading input after a stop; it only touches its own state.
        PSLOG_DEBUG("Job feeder still waiting for input, detaching");
        feeder_thread.detach();
    }

    summary.jobs_read = feeder->jobs_read.load();
    const auto& sstats = scheduler->stats();
    summary.attempts = sstats.dispatched.load();
    summary.connections_ok = sstats.ok.load();
    summary.connections_failed = sstats.failed.load();
    summary.connections_timeout = sstats.timeout.load();
    summary.exchange_errors = sstats.exchange_errors.load();
    summary.records_written = writer.written();
    summary.records_observed = writer.observed();
    summary.packets_seen = obs->stats().packets_seen;
    summary.packets_ignored = obs->stats().packets_ignored;
    summary.flows_emitted = obs->stats().flows_emitted;
    summary.flows_discarded = correlator.stats().flows_discarded;

    if (observer_error) std::rethrow_exception(observer_error);
    if (scheduler_error) std::rethrow_exception(scheduler_error);
    if (feeder->done.load(std::memory_order_acquire) && feeder->error) {
        std::rethrow_exception(feeder->error);
    }
    return summary;
}

void print_run_summary(std::ostream& out, const RunSummary& s) {
    const std::string sep = "+--------------------------------------------------+\n";
    auto row = [&out](const std::string& text) {
        out << "| " << std::left << std::setw(48) << text << " |\n";
    };
    auto join = [](std::initializer_list<std::pair<const char*, uint64_t>> items) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& item : items) {
            if (!first) oss << ' ';
            oss << item.first << '=' << item.second;
            first = false;
        }
        return oss.str();
    };

    out << "\n" << sep;
    row("Run Summary");
    out << sep;
    row("Plugin: " + s.plugin);
    row(join({{"Jobs: read", s.jobs_read}, {"attempts", s.attempts}}));
    row(join({{"  ok", s.connections_ok},
              {"failed", s.connections_failed},
              {"timeout", s.connections_timeout}}));
    row(join({{"  exchange_errors", s.exchange_errors}}));
    row(join({{"Packets: seen", s.packets_seen}, {"ignored", s.packets_ignored}}));
    row(join({{"Flows: emitted", s.flows_emitted}, {"unclaimed", s.flows_discarded}}));
    row(join({{"Records: written", s.records_written}, {"observed", s.records_observed}}));
    out << sep;
    out << "End state: " << (s.stopped ? "Stopped via signal (Ctrl+C)" : "All jobs measured") << "\n";
}

} // namespace pathspider
