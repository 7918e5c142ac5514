// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/app/cli/cli_helpers.h"
#include "pathspider/app/core/SpiderDriver.h"
#include "pathspider/plugins/EcnSpider.h"
#include "pathspider/plugins/TfoSpider.h"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

namespace {

pathspider::cli::CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "pathspider");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return pathspider::cli::parse_args(static_cast<int>(args.size()), argv.data());
}

} // namespace

int main() {
    // Defaults leave the configuration untouched.
    {
        auto opts = pathspider::cli::normalize_options(parse({}));
        assert(opts.config_path == "config/pathspider.yaml");
        assert(opts.source.empty());
        assert(!opts.worker_count);
        assert(!opts.list_plugins);

        pathspider::Config cfg;
        cfg.spider.plugin = "ecn";
        pathspider::cli::apply_to_config(opts, cfg);
        assert(cfg.spider.plugin == "ecn");
        assert(cfg.observer.source == "int:eth0");
        assert(cfg.environment.enabled);
    }

    // Interface shorthand becomes a live capture locator.
    {
        auto opts = pathspider::cli::normalize_options(
            parse({"-p", "TFO", "-i", "wlan0", "-w", "12", "--conn-timeout", "1.5", "--no-env",
                   "-I", "targets.csv", "-o", "-"}));
        assert(opts.plugin == "tfo");
        assert(opts.source == "int:wlan0");
        assert(opts.input_file == "targets.csv");
        assert(opts.output_file.empty());

        pathspider::Config cfg;
        pathspider::cli::apply_to_config(opts, cfg);
        assert(cfg.spider.plugin == "tfo");
        assert(cfg.observer.source == "int:wlan0");
        assert(cfg.spider.worker_count == 12);
        assert(cfg.spider.conn_timeout_seconds == 1.5);
        assert(!cfg.environment.enabled);
    }

    // An explicit locator wins over the interface.
    {
        auto opts = pathspider::cli::normalize_options(
            parse({"--interface", "eth1", "--source", "pcapfile:trace.pcap", "-c", "/etc/ps.yaml", "-l"}));
        assert(opts.source == "pcapfile:trace.pcap");
        assert(opts.config_path == "/etc/ps.yaml");
        assert(opts.list_plugins);
    }

    // Without overrides the plugin picks pool size and connect timeout.
    {
        pathspider::plugins::EcnSpider ecn;
        pathspider::plugins::TfoSpider tfo;
        pathspider::Config cfg;

        auto ecn_opts = pathspider::scheduler_options_for(cfg, ecn);
        assert(ecn_opts.worker_count == 100);
        assert(ecn_opts.conn_timeout == std::chrono::milliseconds(5000));

        auto tfo_opts = pathspider::scheduler_options_for(cfg, tfo);
        assert(tfo_opts.worker_count == 100);
        assert(tfo_opts.conn_timeout == std::chrono::milliseconds(10000));

        auto opts = pathspider::cli::normalize_options(parse({"-w", "12", "--conn-timeout", "1.5"}));
        pathspider::cli::apply_to_config(opts, cfg);
        tfo_opts = pathspider::scheduler_options_for(cfg, tfo);
        assert(tfo_opts.worker_count == 12);
        assert(tfo_opts.conn_timeout == std::chrono::milliseconds(1500));
    }

    assert(pathspider::cli::to_lower("ECN") == "ecn");
    return 0;
}
