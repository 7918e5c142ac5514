// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/config/Config.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace pathspider {
namespace {

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, T& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, std::optional<T>& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

// Convert YAML scalars to JSON types with best-effort typing.
nlohmann::json yaml_scalar_to_json(const YAML::Node& node) {
    bool b{};
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i{};
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d{};
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& elem : node) arr.push_back(yaml_to_json(elem));
        return arr;
    }
    case YAML::NodeType::Map: {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

std::optional<nlohmann::json> load_schema(const std::string& config_path) {
    namespace fs = std::filesystem;
    fs::path schema_path = fs::path(config_path).parent_path() / "config_schema.json";
    std::ifstream in(schema_path);
    if (!in) return std::nullopt;
    try {
        nlohmann::json schema;
        in >> schema;
        return schema;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Invalid config schema " << schema_path << ": " << ex.what() << '\n';
        return std::nullopt;
    }
}

bool validate_root(const YAML::Node& root, const nlohmann::json& schema, std::string& error) {
    try {
        nlohmann::json_schema::json_validator validator(
            nullptr,
            nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);
        validator.validate(yaml_to_json(root));
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

std::vector<std::vector<std::string>> read_commands(const YAML::Node& node) {
    std::vector<std::vector<std::string>> commands;
    if (!node) return commands;
    for (const auto& cmd : node) {
        commands.push_back(cmd.as<std::vector<std::string>>());
    }
    return commands;
}

void apply_spider_config(const YAML::Node& spider, Config::SpiderConfig& cfg) {
    if (!spider) return;
    set_if_present(spider, "plugin", cfg.plugin);
    set_if_present(spider, "worker_count", cfg.worker_count);
    set_if_present(spider, "conn_timeout_seconds", cfg.conn_timeout_seconds);
    set_if_present(spider, "grace_period_seconds", cfg.grace_period_seconds);
}

bool apply_observer_config(const YAML::Node& observer, Config::ObserverConfig& cfg) {
    if (!observer) return true;
    set_if_present(observer, "source", cfg.source);
    set_if_present(observer, "bpf_filter", cfg.bpf_filter);
    set_if_present(observer, "flow_idle_timeout_seconds", cfg.flow_idle_timeout_seconds);
    set_if_present(observer, "poll_budget", cfg.poll_budget);
    set_if_present(observer, "snaplen", cfg.snaplen);
    set_if_present(observer, "read_timeout_ms", cfg.read_timeout_ms);
    set_if_present(observer, "local_addresses", cfg.local_addresses);

    if (auto ports = observer["ports"]) {
        cfg.ports.clear();
        for (const auto& entry : ports) {
            auto range = parse_port_range(entry.as<std::string>());
            if (!range) {
                std::cerr << "Invalid observer port range: " << entry.as<std::string>() << '\n';
                return false;
            }
            cfg.ports.push_back(*range);
        }
    }
    return true;
}

void apply_environment_config(const YAML::Node& env, Config::EnvironmentConfig& cfg) {
    if (!env) return;
    set_if_present(env, "enabled", cfg.enabled);
    cfg.config_zero = read_commands(env["config_zero"]);
    cfg.config_one = read_commands(env["config_one"]);
}

void apply_resolver_config(const YAML::Node& resolver, Config::ResolverConfig& cfg) {
    if (!resolver) return;
    set_if_present(resolver, "url", cfg.url);
    set_if_present(resolver, "poll_interval_seconds", cfg.poll_interval_seconds);
    set_if_present(resolver, "request_timeout_seconds", cfg.request_timeout_seconds);
}

} // namespace

std::optional<std::pair<uint16_t, uint16_t>> parse_port_range(const std::string& text) {
    auto parse_port = [](const std::string& part) -> std::optional<uint16_t> {
        if (part.empty() || part.size() > 5) return std::nullopt;
        unsigned long value = 0;
        for (char ch : part) {
            if (ch < '0' || ch > '9') return std::nullopt;
            value = value * 10 + static_cast<unsigned long>(ch - '0');
        }
        if (value == 0 || value > 65535) return std::nullopt;
        return static_cast<uint16_t>(value);
    };

    const auto dash = text.find('-');
    if (dash == std::string::npos) {
        auto port = parse_port(text);
        if (!port) return std::nullopt;
        return std::make_pair(*port, *port);
    }
    auto lo = parse_port(text.substr(0, dash));
    auto hi = parse_port(text.substr(dash + 1));
    if (!lo || !hi || *lo > *hi) return std::nullopt;
    return std::make_pair(*lo, *hi);
}

/**
 * @brief Populate a Config structure from a YAML document on disk.
 */
std::optional<Config> Config::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return std::nullopt;
    } catch (const YAML::ParserException&) {
        return std::nullopt;
    }

    Config cfg;

    auto schema = load_schema(path);
    if (!schema) {
        std::cerr << "Failed to load config schema near " << path << '\n';
        return std::nullopt;
    }

    std::string validation_error;
    if (!validate_root(root, *schema, validation_error)) {
        std::cerr << "Config validation failed: " << validation_error << '\n';
        return std::nullopt;
    }

    try {
        if (auto log = root["log"]) {
            set_if_present(log, "mode", cfg.log_mode);
            set_if_present(log, "level", cfg.log_level);
            set_if_present(log, "file", cfg.log_file);
        }
        apply_spider_config(root["spider"], cfg.spider);
        if (!apply_observer_config(root["observer"], cfg.observer)) {
            return std::nullopt;
        }
        apply_environment_config(root["environment"], cfg.environment);
        apply_resolver_config(root["resolver"], cfg.resolver);
    } catch (const YAML::Exception& ex) {
        std::cerr << "Config parse error: " << ex.what() << '\n';
        return std::nullopt;
    }

    if ((cfg.spider.worker_count && *cfg.spider.worker_count == 0) ||
        (cfg.spider.conn_timeout_seconds && *cfg.spider.conn_timeout_seconds <= 0.0)) {
        return std::nullopt;
    }

    return cfg;
}

} // namespace pathspider
