// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/app/core/SpiderDriver.h"
#include "pathspider/net/PacketSourceFactory.h"
#include "pathspider/plugins/EcnSpider.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace pathspider;

namespace {

// Capture that never sees a packet: every active record goes out unobserved.
class SilentSource : public net::PacketSource {
public:
    bool open(const std::string&) override { return true; }
    void close() override {}
    bool poll(const net::PacketHandler&, std::size_t) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return true;
    }
};

class SilentSourceFactory : public net::IPacketSourceFactory {
public:
    net::PacketSourcePtr create(const Config&) const override {
        return std::make_unique<SilentSource>();
    }
};

// Minimal HTTP server on 127.0.0.1 answering every request with 200.
class LoopbackHttpServer {
public:
    LoopbackHttpServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(fd_ >= 0);
        const int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        int rc = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = ::listen(fd_, 16);
        assert(rc == 0);

        socklen_t len = sizeof(addr);
        rc = ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        assert(rc == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackHttpServer() {
        stop_.store(true);
        thread_.join();
        ::close(fd_);
    }

    uint16_t port() const { return port_; }

private:
    void serve() {
        while (!stop_.load()) {
            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 20) <= 0) continue;

            const int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) continue;

            std::string request;
            char buf[512];
            while (request.find("\r\n\r\n") == std::string::npos) {
                const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<std::size_t>(n));
            }
            static const std::string reply =
                "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
            ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
            ::close(client);
        }
    }

    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // namespace

int main() {
    SilentSourceFactory factory;
    net::set_packet_source_factory_for_tests(&factory);

    LoopbackHttpServer server;

    Config cfg;
    cfg.spider.plugin = "ecn";
    cfg.spider.worker_count = 1;
    cfg.spider.conn_timeout_seconds = 2.0;
    cfg.spider.grace_period_seconds = 0.2;
    cfg.observer.source = "int:lo";
    cfg.environment.enabled = false;

    plugins::EcnSpider plugin;
    spider::NoopEnvironment environment;

    std::istringstream input("127.0.0.1," + std::to_string(server.port()) + "\n");
    std::ostringstream output;

    DriverOptions opts;
    opts.input = &input;
    opts.output = &output;
    opts.should_stop = [] { return false; };
    opts.environment = &environment;

    const RunSummary summary = run_spider(cfg, plugin, opts);
    assert(!summary.stopped);
    assert(summary.plugin == "ecn");
    assert(summary.jobs_read == 1);
    assert(summary.attempts == 2);
    assert(summary.connections_ok == 2);
    assert(summary.records_written == 2);
    assert(summary.records_observed == 0);

    std::istringstream lines(output.str());
    std::string line;
    std::set<int> configs;
    std::set<int> local_ports;
    while (std::getline(lines, line)) {
        const auto doc = nlohmann::json::parse(line);
        assert(doc.at("dip") == "127.0.0.1");
        assert(doc.at("dp") == server.port());
        assert(doc.at("connstate") == "ok");
        assert(doc.at("result") == 200);
        assert(doc.at("observed") == false);
        configs.insert(doc.at("config").get<int>());
        local_ports.insert(doc.at("sp").get<int>());
    }
    assert(configs == (std::set<int>{0, 1}));
    // Local ports come from the kernel, one connection per configuration.
    assert(!local_ports.empty());
    assert(local_ports.count(0) == 0);

    std::ostringstream summary_text;
    print_run_summary(summary_text, summary);
    assert(summary_text.str().find("All jobs measured") != std::string::npos);

    net::set_packet_source_factory_for_tests(nullptr);
    return 0;
}
