// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/config/Config.h"

#include <optional>
#include <string>

namespace pathspider::cli {

struct CliOptions {
    std::string config_path = "config/pathspider.yaml";
    std::string plugin;
    std::string source;            // capture locator, overrides observer.source
    std::string iface;             // shorthand for source "int:<iface>"
    std::string input_file;        // empty or "-": stdin
    std::string output_file;       // empty or "-": stdout
    std::optional<unsigned> worker_count;
    std::optional<double> conn_timeout_seconds;
    bool list_plugins = false;
    bool no_env = false;
};

std::string to_lower(std::string value);
CliOptions parse_args(int argc, char** argv);
CliOptions normalize_options(CliOptions opts);

/// Fold command-line overrides into a loaded configuration.
void apply_to_config(const CliOptions& opts, Config& cfg);

} // namespace pathspider::cli
