// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/config/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;
using pathspider::Config;

namespace {

void write_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() / ("pathspider_cfg_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    write_file(dir / "config_schema.json", "{}");

    // Full document.
    {
        const auto path = dir / "full.yaml";
        write_file(path,
                   "log:\n"
                   "  mode: file\n"
                   "  level: debug\n"
                   "  file: /tmp/ps.log\n"
                   "spider:\n"
                   "  plugin: ecn\n"
                   "  worker_count: 8\n"
                   "  conn_timeout_seconds: 2.5\n"
                   "  grace_period_seconds: 1\n"
                   "observer:\n"
                   "  source: \"pcapfile:/tmp/trace.pcap\"\n"
                   "  ports: [80, \"8000-8080\"]\n"
                   "  local_addresses: [\"192.0.2.1\"]\n"
                   "  flow_idle_timeout_seconds: 10\n"
                   "environment:\n"
                   "  enabled: false\n"
                   "  config_one:\n"
                   "    - [\"sysctl\", \"-w\", \"net.ipv4.tcp_ecn=1\"]\n"
                   "resolver:\n"
                   "  url: \"http://resolver.example/\"\n"
                   "  request_timeout_seconds: 30\n");
        auto cfg = Config::from_file(path.string());
        assert(cfg);
        assert(cfg->log_mode == "file");
        assert(cfg->log_level == "debug");
        assert(cfg->spider.plugin == "ecn");
        assert(cfg->spider.worker_count == 8);
        assert(cfg->spider.conn_timeout_seconds == 2.5);
        assert(cfg->observer.source == "pcapfile:/tmp/trace.pcap");
        assert(cfg->observer.ports.size() == 2);
        assert((cfg->observer.ports[0] == std::pair<uint16_t, uint16_t>(80, 80)));
        assert((cfg->observer.ports[1] == std::pair<uint16_t, uint16_t>(8000, 8080)));
        assert(cfg->observer.local_addresses.size() == 1);
        assert(cfg->observer.flow_idle_timeout_seconds == 10.0);
        assert(!cfg->environment.enabled);
        assert(cfg->environment.config_zero.empty());
        assert(cfg->environment.config_one.size() == 1);
        assert(cfg->environment.config_one[0].size() == 3);
        assert(cfg->environment.config_one[0][2] == "net.ipv4.tcp_ecn=1");
        assert(cfg->resolver.url == "http://resolver.example/");
        assert(cfg->resolver.request_timeout_seconds == 30.0);
    }

    // Missing sections keep their defaults.
    {
        const auto path = dir / "minimal.yaml";
        write_file(path, "spider:\n  plugin: tfo\n");
        auto cfg = Config::from_file(path.string());
        assert(cfg);
        // Pool size and connect timeout fall through to the plugin.
        assert(!cfg->spider.worker_count);
        assert(!cfg->spider.conn_timeout_seconds);
        assert(cfg->resolver.poll_interval_seconds == 5.0);
        assert(cfg->observer.source == "int:eth0");
        assert(cfg->environment.enabled);
    }

    // Rejected documents.
    {
        const auto zero_workers = dir / "zero.yaml";
        write_file(zero_workers, "spider:\n  worker_count: 0\n");
        assert(!Config::from_file(zero_workers.string()));

        const auto bad_range = dir / "range.yaml";
        write_file(bad_range, "observer:\n  ports: [\"9000-80\"]\n");
        assert(!Config::from_file(bad_range.string()));

        const auto broken = dir / "broken.yaml";
        write_file(broken, "spider: [unterminated\n");
        assert(!Config::from_file(broken.string()));

        assert(!Config::from_file((dir / "missing.yaml").string()));
    }

    assert((pathspider::parse_port_range("443") == std::pair<uint16_t, uint16_t>(443, 443)));
    assert(!pathspider::parse_port_range("0"));
    assert(!pathspider::parse_port_range("70000"));
    assert(!pathspider::parse_port_range("a-b"));

    // The shipped configuration validates against the shipped schema.
    if (const char* shipped = std::getenv("PATHSPIDER_CONFIG_DIR")) {
        const fs::path shipped_dir(shipped);
        auto cfg = Config::from_file((shipped_dir / "pathspider.yaml").string());
        assert(cfg);
        assert(cfg->spider.plugin == "tfo");

        // Copy the real schema next to a document it must reject.
        const fs::path strict = dir / "strict";
        fs::create_directories(strict);
        fs::copy_file(shipped_dir / "config_schema.json", strict / "config_schema.json",
                      fs::copy_options::overwrite_existing);
        write_file(strict / "bad.yaml", "log:\n  level: loud\n");
        assert(!Config::from_file((strict / "bad.yaml").string()));
        write_file(strict / "unknown.yaml", "spider:\n  workers: 3\n");
        assert(!Config::from_file((strict / "unknown.yaml").string()));
        write_file(strict / "eager.yaml", "resolver:\n  poll_interval_seconds: 1\n");
        assert(!Config::from_file((strict / "eager.yaml").string()));
        assert(cfg->resolver.poll_interval_seconds >= 5.0);
    }

    fs::remove_all(dir);
    return 0;
}
