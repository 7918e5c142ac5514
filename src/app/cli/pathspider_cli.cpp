// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/app/cli/cli_helpers.h"
#include "pathspider/app/core/SpiderDriver.h"
#include "pathspider/Errors.h"
#include "pathspider/config/Config.h"
#include "pathspider/log/Log.h"
#include "pathspider/plugins/PluginRegistry.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

volatile sig_atomic_t g_stop_requested = 0;

void handle_signal(int sig) {
    // Only note the request; the driver polls the flag between jobs.
    if (!g_stop_requested) {
        static const char msg[] = "\nStopping, waiting for in-flight connections...\n";
        ssize_t rc = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)rc;
    }
    g_stop_requested = 1;
    std::signal(sig, handle_signal);
}

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

void init_logger_from_cfg(const pathspider::Config& config) {
    pathspider::LoggerConfig lc;
    lc.mode = pathspider::parse_log_mode(pathspider::cli::to_lower(config.log_mode));
    lc.level = pathspider::parse_log_level(pathspider::cli::to_lower(config.log_level));
    lc.file_path = config.log_file;
    pathspider::Logger::set_level(lc.level);
    pathspider::Logger::init(lc);
}

} // namespace

int main(int argc, char** argv) {
    auto cli_opts = pathspider::cli::normalize_options(pathspider::cli::parse_args(argc, argv));
    const auto registry = pathspider::plugins::PluginRegistry::builtin();

    if (cli_opts.list_plugins) {
        std::cout << "Available plugins:\n";
        for (const auto& name : registry.names()) {
            auto plugin = registry.create(name);
            std::cout << "  " << name << "\t" << plugin->description() << "\n";
        }
        return 0;
    }

    auto cfg = pathspider::Config::from_file(cli_opts.config_path);
    if (!cfg) {
        std::cerr << "Failed to load config: " << cli_opts.config_path << '\n';
        return 1;
    }
    pathspider::cli::apply_to_config(cli_opts, *cfg);
    init_logger_from_cfg(*cfg);

    if (cfg->spider.plugin.empty()) {
        std::cerr << "No plugin selected (use --plugin, see --list-plugins)\n";
        return 1;
    }
    auto plugin = registry.create(cfg->spider.plugin);
    if (!plugin) {
        std::cerr << "Unknown plugin: " << cfg->spider.plugin << " (see --list-plugins)\n";
        return 1;
    }

    std::ifstream input_file;
    std::istream* input = &std::cin;
    if (!cli_opts.input_file.empty()) {
        input_file.open(cli_opts.input_file);
        if (!input_file) {
            std::cerr << "Cannot open input file '" << cli_opts.input_file
                      << "': " << std::strerror(errno) << '\n';
            return 1;
        }
        input = &input_file;
    }

    std::ofstream output_file;
    std::ostream* output = &std::cout;
    if (!cli_opts.output_file.empty()) {
        output_file.open(cli_opts.output_file, std::ios::out | std::ios::trunc);
        if (!output_file) {
            std::cerr << "Cannot open output file '" << cli_opts.output_file
                      << "': " << std::strerror(errno) << '\n';
            return 1;
        }
        output = &output_file;
    }

    install_signal_handlers();

    pathspider::DriverOptions driver_opts;
    driver_opts.input = input;
    driver_opts.output = output;
    driver_opts.should_stop = [] { return g_stop_requested != 0; };

    std::cerr << "Measuring with plugin " << plugin->name() << " while observing "
              << cfg->observer.source << " (Ctrl+C to stop)..." << std::endl;

    pathspider::RunSummary summary;
    try {
        summary = pathspider::run_spider(*cfg, *plugin, driver_opts);
    } catch (const pathspider::ObserverError& ex) {
        std::cerr << "Observer error: " << ex.what() << '\n';
        return 1;
    } catch (const pathspider::EnvironmentSetupError& ex) {
        std::cerr << "Environment setup failed: " << ex.what() << '\n';
        return 1;
    } catch (const pathspider::JobFormatError& ex) {
        std::cerr << "Malformed input at line " << ex.line() << ": " << ex.what() << '\n';
        return 1;
    }

    pathspider::print_run_summary(std::cerr, summary);
    if (summary.stopped) {
        std::cerr << "kthxbye\n";
    }
    return 0;
}
