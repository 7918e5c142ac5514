// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Config.h
 * @brief Configuration holder parsed from YAML.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pathspider {

/**
 * @brief In-memory representation of the YAML configuration file.
 */
struct Config {
    /**
     * @brief Active side: which plugin runs and how hard it is driven.
     */
    struct SpiderConfig {
        std::string plugin;                     // empty: must come from the command line
        std::optional<unsigned> worker_count;      // unset: plugin default
        std::optional<double>   conn_timeout_seconds;
        double      grace_period_seconds = 5.0; // correlator wait after the last active record
    };

    struct ObserverConfig {
        std::string source = "int:eth0";        // int:<ifname> | pcapfile:<path>
        std::string bpf_filter;                 // pushed down to the capture backend
        std::vector<std::pair<uint16_t, uint16_t>> ports; // inclusive ranges; empty = all
        std::vector<std::string> local_addresses;
        double      flow_idle_timeout_seconds = 30.0;
        unsigned    poll_budget = 64;           // packets per poll() call
        unsigned    snaplen = 262144;
        unsigned    read_timeout_ms = 100;
    };

    /**
     * @brief Privileged configuration commands run between phases.
     *
     * Empty command lists mean "use the plugin's defaults".
     */
    struct EnvironmentConfig {
        bool enabled = true;
        std::vector<std::vector<std::string>> config_zero;
        std::vector<std::vector<std::string>> config_one;
    };

    struct ResolverConfig {
        std::string url;
        double poll_interval_seconds = 5.0;  // result polling, never below 5 s
        double request_timeout_seconds = 60.0;
    };

    SpiderConfig      spider{};
    ObserverConfig    observer{};
    EnvironmentConfig environment{};
    ResolverConfig    resolver{};

    // Logging
    std::string log_mode  = "console";        // console|file|silent
    std::string log_level = "info";           // trace|debug|info|warn|error
    std::string log_file  = "pathspider.log"; // Only used when mode==file.

    /**
     * @brief Parse configuration from a YAML document validated against
     *        config_schema.json in the same directory.
     *
     * @param path File path to read.
     * @return Populated config on success, std::nullopt on failure.
     */
    static std::optional<Config> from_file(const std::string& path);
};

/**
 * @brief Parse "80", "8000-8080" style port range text; nullopt when invalid.
 */
std::optional<std::pair<uint16_t, uint16_t>> parse_port_range(const std::string& text);

} // namespace pathspider
