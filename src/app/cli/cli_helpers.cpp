// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/app/cli/cli_helpers.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

namespace pathspider::cli {

std::string to_lower(std::string value) {
    for (auto& ch : value) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return value;
}

namespace {

void print_usage() {
    std::cout << "Usage: pathspider [options]\n"
              << "  -p, --plugin <name>        Measurement plugin (see --list-plugins)\n"
              << "  -l, --list-plugins         List available plugins and exit\n"
              << "  -i, --interface <dev>      Observe live traffic on <dev>\n"
              << "  -s, --source <locator>     Capture locator: int:<dev> or pcapfile:<path>\n"
              << "  -w, --worker-count <n>     Concurrent connection workers (default 100)\n"
              << "  -I, --input-file <path>    CSV job list (default stdin)\n"
              << "  -o, --output-file <path>   JSON lines output (default stdout)\n"
              << "  -c, --config <path>        Configuration file (default config/pathspider.yaml)\n"
              << "  --conn-timeout <seconds>   Per-connection timeout (default 5)\n"
              << "  --no-env                   Do not run environment setup commands\n"
              << "  -h, --help                 Show this help\n"
              << "\nEach job is measured once per configuration. Ctrl+C stops early.\n";
}

} // namespace

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if ((arg == "--plugin" || arg == "-p") && i + 1 < argc) {
            opts.plugin = to_lower(argv[++i]);
        } else if (arg == "--list-plugins" || arg == "-l") {
            opts.list_plugins = true;
        } else if ((arg == "--interface" || arg == "-i") && i + 1 < argc) {
            opts.iface = argv[++i];
        } else if ((arg == "--source" || arg == "-s") && i + 1 < argc) {
            opts.source = argv[++i];
        } else if ((arg == "--worker-count" || arg == "-w") && i + 1 < argc) {
            std::string value = argv[++i];
            char* end = nullptr;
            errno = 0;
            long n = std::strtol(value.c_str(), &end, 10);
            if (errno != 0 || end == value.c_str() || *end != '\0' || n <= 0) {
                std::cerr << "Invalid worker count: " << value << '\n';
                std::exit(1);
            }
            opts.worker_count = static_cast<unsigned>(n);
        } else if ((arg == "--input-file" || arg == "-I") && i + 1 < argc) {
            opts.input_file = argv[++i];
        } else if ((arg == "--output-file" || arg == "-o") && i + 1 < argc) {
            opts.output_file = argv[++i];
        } else if (arg == "--conn-timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            char* end = nullptr;
            errno = 0;
            double t = std::strtod(value.c_str(), &end);
            if (errno != 0 || end == value.c_str() || *end != '\0' || t <= 0.0) {
                std::cerr << "Invalid connection timeout: " << value << '\n';
                std::exit(1);
            }
            opts.conn_timeout_seconds = t;
        } else if (arg == "--no-env") {
            opts.no_env = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage();
            std::exit(1);
        }
    }

    return opts;
}

CliOptions normalize_options(CliOptions opts) {
    // An explicit locator wins over the interface shorthand.
    if (opts.source.empty() && !opts.iface.empty()) {
        opts.source = "int:" + opts.iface;
    }
    if (opts.input_file == "-") opts.input_file.clear();
    if (opts.output_file == "-") opts.output_file.clear();
    opts.plugin = to_lower(opts.plugin);
    return opts;
}

void apply_to_config(const CliOptions& opts, Config& cfg) {
    if (!opts.plugin.empty()) cfg.spider.plugin = opts.plugin;
    if (!opts.source.empty()) cfg.observer.source = opts.source;
    if (opts.worker_count) cfg.spider.worker_count = *opts.worker_count;
    if (opts.conn_timeout_seconds) cfg.spider.conn_timeout_seconds = *opts.conn_timeout_seconds;
    if (opts.no_env) cfg.environment.enabled = false;
}

} // namespace pathspider::cli
