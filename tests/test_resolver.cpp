// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/Errors.h"
#include "pathspider/resolver/ResolverClient.h"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace pathspider;
using namespace pathspider::resolver;

namespace {

class FakeTransport : public ResolverTransport {
public:
    std::vector<std::string> retrieve_capabilities(const std::string&) override {
        ++capability_calls;
        if (unreachable) throw ResolverError("connection refused");
        return capabilities;
    }

    std::optional<std::string> invoke(const std::string& capability, const std::string&,
                                      const nlohmann::json& parameters) override {
        invoked.push_back(capability);
        last_parameters = parameters;
        if (!issue_token) return std::nullopt;
        return "token-" + std::to_string(invoked.size());
    }

    ResolverReply result_for(const std::string& token) override {
        ++polls;
        if (polls <= pending_polls) return Receipt{token};
        if (fail) return ResolverException{"no peers"};
        return ResolverResult{rows};
    }

    void forget(const std::string& token) override { forgotten.push_back(token); }

    std::vector<std::string> capabilities{"btdhtresolver-ip4", "webresolver-ip4"};
    bool unreachable = false;
    bool issue_token = true;
    bool fail = false;
    int pending_polls = 0;
    int polls = 0;
    int capability_calls = 0;
    std::vector<nlohmann::json> rows;
    std::vector<std::string> invoked;
    std::vector<std::string> forgotten;
    nlohmann::json last_parameters;
};

// Asks for 1 ms polling; the client must not honour anything below kMinPollInterval.
ResolverOptions fast_options() {
    ResolverOptions opts;
    opts.url = "https://resolver.example/";
    opts.poll_interval = std::chrono::milliseconds(1);
    opts.request_timeout = std::chrono::milliseconds(300);
    return opts;
}

} // namespace

int main() {
    // DHT peers: usable rows become jobs, the token is released.
    {
        FakeTransport transport;
        transport.rows = {
            nlohmann::json::object({{"destination.ip4", "192.0.2.44"}, {"destination.port", 6881}}),
            nlohmann::json::object({{"destination.ip4", "192.0.2.45"}}),  // no port
            nlohmann::json::object({{"destination.ip4", "not-an-address"}, {"destination.port", 1}}),
            nlohmann::json::object({{"destination.ip4", "192.0.2.46"}, {"destination.port", 51413}}),
        };
        transport.pending_polls = 1;
        auto opts = fast_options();
        opts.request_timeout = std::chrono::seconds(20);
        BtDhtResolverClient client(transport, opts);
        const auto start = std::chrono::steady_clock::now();
        auto jobs = client.request(5);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        // One receipt, then the result one throttled interval later.
        assert(transport.polls == 2);
        assert(elapsed >= kMinPollInterval);
        assert(elapsed < kMinPollInterval * 2);
        assert(jobs.size() == 2);
        assert(jobs[0].address.to_string() == "192.0.2.44");
        assert(jobs[0].port == 6881);
        assert(jobs[1].port == 51413);
        assert(transport.invoked.back() == "btdhtresolver-ip4");
        assert(transport.last_parameters.at("btdhtresolver.count") == 5);
        assert(transport.forgotten.size() == 1);
        // Capabilities are refreshed at most once per interval.
        assert(client.refresh_count() == static_cast<std::size_t>(transport.capability_calls));
        assert(transport.capability_calls <= 2);
    }

    // An exception reply yields no targets.
    {
        FakeTransport transport;
        transport.fail = true;
        BtDhtResolverClient client(transport, fast_options());
        assert(client.request(3).empty());
        assert(transport.forgotten.size() == 1);
    }

    // Capability not offered.
    {
        FakeTransport transport;
        BtDhtResolverClient client(transport, fast_options());
        bool threw = false;
        try {
            client.request(3, "ip6");
        } catch (const ResolverTimeout&) {
            assert(false && "not a timeout");
        } catch (const ResolverError&) {
            threw = true;
        }
        assert(threw);
        assert(transport.invoked.empty());
    }

    // No result within the request timeout.
    {
        FakeTransport transport;
        transport.pending_polls = 1 << 30;
        BtDhtResolverClient client(transport, fast_options());
        const auto start = std::chrono::steady_clock::now();
        bool timed_out = false;
        try {
            client.request(1);
        } catch (const ResolverTimeout&) {
            timed_out = true;
        }
        assert(timed_out);
        // A 300 ms budget leaves room for a single poll and ends on time.
        assert(transport.polls == 1);
        assert(std::chrono::steady_clock::now() - start < kMinPollInterval);
    }

    // Resolver unreachable at start: the client exists but cannot invoke anything yet.
    {
        FakeTransport transport;
        transport.unreachable = true;
        BtDhtResolverClient client(transport, fast_options());
        assert(client.refresh_count() == 0);
        bool threw = false;
        try {
            client.request(1);
        } catch (const ResolverError&) {
            threw = true;
        }
        assert(threw);
    }

    // Web resolver: URLs are consumed in order, hosts carried into jobs.
    {
        FakeTransport transport;
        transport.rows = {
            nlohmann::json::object({{"destination.ip4", "203.0.113.8"}, {"destination.port", 80},
                                    {"destination.url", "http://a.example/"}}),
        };
        WebResolverClient client(transport, fast_options(), {"http://a.example/", "http://b.example/"});
        client.extend({"http://c.example/"});
        assert(client.queued() == 3);

        auto jobs = client.request(2);
        assert(client.queued() == 1);
        assert(transport.invoked.back() == "webresolver-ip4");
        const auto& urls = transport.last_parameters.at("destination.url");
        assert(urls.size() == 2);
        assert(urls[0] == "http://a.example/");
        assert(urls[1] == "http://b.example/");
        assert(jobs.size() == 1);
        assert(jobs[0].host && *jobs[0].host == "http://a.example/");
    }

    // Missing token.
    {
        FakeTransport transport;
        transport.issue_token = false;
        BtDhtResolverClient client(transport, fast_options());
        bool threw = false;
        try {
            client.request(1);
        } catch (const ResolverError&) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
