// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/resolver/ResolverClient.h"

#include "pathspider/Errors.h"
#include "pathspider/log/Log.h"

#include <algorithm>
#include <thread>

namespace pathspider::resolver {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

ResolverOptions ResolverOptions::from_config(const Config& cfg) {
    ResolverOptions opts;
    opts.url = cfg.resolver.url;
    opts.poll_interval = seconds_to_ms(cfg.resolver.poll_interval_seconds);
    opts.request_timeout = seconds_to_ms(cfg.resolver.request_timeout_seconds);
    return opts;
}

ResolverClient::ResolverClient(ResolverTransport& transport, ResolverOptions options)
    : transport_(transport), options_(std::move(options)) {
    if (options_.poll_interval < kMinPollInterval) {
        PSLOG_DEBUG("Resolver poll interval %lld ms raised to %lld ms",
                    static_cast<long long>(options_.poll_interval.count()),
                    static_cast<long long>(kMinPollInterval.count()));
        options_.poll_interval = kMinPollInterval;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    refresh_if_stale_locked();
}

std::size_t ResolverClient::refresh_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return refresh_count_;
}

void ResolverClient::refresh_if_stale_locked() {
    const auto now = std::chrono::steady_clock::now();
    if (last_refreshed_ && now - *last_refreshed_ < options_.min_refresh_interval) {
        return;
    }
    try {
        capabilities_ = transport_.retrieve_capabilities(options_.url);
        last_refreshed_ = now;
        ++refresh_count_;
    } catch (const ResolverError& ex) {
        PSLOG_WARN("%s unreachable (%s), retrying later", options_.url.c_str(), ex.what());
    }
}

std::string ResolverClient::invoke(const std::string& label, const std::string& when,
                                   const nlohmann::json& parameters) {
    std::lock_guard<std::mutex> lk(mtx_);
    refresh_if_stale_locked();
    if (std::find(capabilities_.begin(), capabilities_.end(), label) == capabilities_.end()) {
        throw ResolverError(options_.url + " does not support '" + label + "'");
    }
    auto token = transport_.invoke(label, when, parameters);
    if (!token) {
        throw ResolverError("could not acquire request token for '" + label + "'");
    }
    return *token;
}

std::optional<std::vector<nlohmann::json>> ResolverClient::fetch_result(const std::string& token) {
    const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            refresh_if_stale_locked();

            ResolverReply reply = transport_.result_for(token);
            if (auto* ex = std::get_if<ResolverException>(&reply)) {
                PSLOG_WARN("Resolver exception for %s: %s", token.c_str(), ex->message.c_str());
                transport_.forget(token);
                return std::nullopt;
            }
            if (auto* res = std::get_if<ResolverResult>(&reply)) {
                transport_.forget(token);
                return std::move(res->rows);
            }
            // Receipt: still pending.
        }
        const auto left = deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, options_.poll_interval));
    }

    throw ResolverTimeout("could not complete address retrieval within " +
                          std::to_string(options_.request_timeout.count()) + " ms");
}

std::vector<spider::Job> ResolverClient::rows_to_jobs(const std::vector<nlohmann::json>& rows,
                                                      const std::string& ipv) const {
    std::vector<spider::Job> jobs;
    const std::string addr_key = "destination." + ipv;
    for (const auto& row : rows) {
        if (!row.contains(addr_key) || !row.contains("destination.port")) {
            PSLOG_WARN("Resolver row without %s/destination.port: %s",
                       addr_key.c_str(), row.dump().c_str());
            continue;
        }
        auto addr = net::IpAddress::parse(row.at(addr_key).get<std::string>());
        const auto port = row.at("destination.port").get<long long>();
        if (!addr || port <= 0 || port > 65535) {
            PSLOG_WARN("Skipping unusable resolver row: %s", row.dump().c_str());
            continue;
        }
        spider::Job job;
        job.address = *addr;
        job.port = static_cast<uint16_t>(port);
        if (row.contains("destination.url")) {
            job.host = row.at("destination.url").get<std::string>();
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<spider::Job> BtDhtResolverClient::request(std::size_t count,
                                                      const std::string& ipv,
                                                      const std::string& when) {
    const std::string token = invoke("btdhtresolver-" + ipv, when,
                                     nlohmann::json{{"btdhtresolver.count", count}});
    auto rows = fetch_result(token);
    if (!rows) return {};
    return rows_to_jobs(*rows, ipv);
}

WebResolverClient::WebResolverClient(ResolverTransport& transport,
                                     ResolverOptions options,
                                     std::vector<std::string> urls)
    : ResolverClient(transport, std::move(options)),
      queued_(urls.begin(), urls.end()) {}

void WebResolverClient::extend(const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lk(mtx_);
    queued_.insert(queued_.end(), urls.begin(), urls.end());
}

std::size_t WebResolverClient::queued() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queued_.size();
}

std::vector<spider::Job> WebResolverClient::request(std::size_t count,
                                                    const std::string& ipv,
                                                    const std::string& when) {
    std::vector<std::string> batch;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        while (batch.size() < count && !queued_.empty()) {
            batch.push_back(std::move(queued_.front()));
            queued_.pop_front();
        }
    }
    const std::string token = invoke("webresolver-" + ipv, when,
                                     nlohmann::json{{"destination.url", batch}});
    auto rows = fetch_result(token);
    if (!rows) return {};
    return rows_to_jobs(*rows, ipv);
}

} // namespace pathspider::resolver
