// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file ResolverClient.h
 * @brief Request/poll client for a target-address resolver service.
 *
 * The wire protocol lives behind ResolverTransport; this layer handles
 * capability refresh throttling, polling and the overall timeout.
 */
#include "pathspider/config/Config.h"
#include "pathspider/spider/Records.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pathspider::resolver {

/// The request was accepted; poll again later.
struct Receipt {
    std::string token;
};

/// The resolver failed the request.
struct ResolverException {
    std::string message;
};

/// Result rows, one JSON object per resolved target.
struct ResolverResult {
    std::vector<nlohmann::json> rows;
};

using ResolverReply = std::variant<Receipt, ResolverException, ResolverResult>;

/**
 * @brief Transport to the resolver service.
 *
 * Calls are serialised by ResolverClient. Implementations throw
 * ResolverError when the service is unreachable.
 */
class ResolverTransport {
public:
    virtual ~ResolverTransport() = default;

    /// Fetch the capability list advertised at @p url.
    virtual std::vector<std::string> retrieve_capabilities(const std::string& url) = 0;

    /// Start @p capability; returns the token to poll, nullopt if none was issued.
    virtual std::optional<std::string> invoke(const std::string& capability,
                                              const std::string& when,
                                              const nlohmann::json& parameters) = 0;

    virtual ResolverReply result_for(const std::string& token) = 0;

    virtual void forget(const std::string& token) = 0;
};

/// Result polls are never closer together than this.
constexpr std::chrono::milliseconds kMinPollInterval{5000};

struct ResolverOptions {
    std::string url;
    std::chrono::milliseconds poll_interval{kMinPollInterval};  ///< Raised to kMinPollInterval if lower.
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds min_refresh_interval{5000};

    static ResolverOptions from_config(const Config& cfg);
};

/**
 * @brief Common polling logic shared by the concrete resolver clients.
 *
 * One mutex guards the transport, the last-refresh timestamp and the cached
 * capabilities, so any number of threads may issue requests.
 */
class ResolverClient {
public:
    ResolverClient(ResolverTransport& transport, ResolverOptions options);
    virtual ~ResolverClient() = default;

    /**
     * @brief Ask for up to @p count targets.
     *
     * @param ipv "ip4" or "ip6".
     * @return jobs built from the result rows; empty if the resolver reported an exception.
     * @throws ResolverTimeout when no result arrives within the request timeout.
     * @throws ResolverError when the capability is not offered.
     */
    virtual std::vector<spider::Job> request(std::size_t count,
                                             const std::string& ipv = "ip4",
                                             const std::string& when = "now ... future") = 0;

    std::size_t refresh_count() const;

protected:
    /// Invoke @p label if the cached capabilities advertise it.
    std::string invoke(const std::string& label, const std::string& when,
                       const nlohmann::json& parameters);

    /// Poll @p token until a result, an exception or the timeout.
    std::optional<std::vector<nlohmann::json>> fetch_result(const std::string& token);

    std::vector<spider::Job> rows_to_jobs(const std::vector<nlohmann::json>& rows,
                                          const std::string& ipv) const;

    mutable std::mutex mtx_;

private:
    /// Refresh capabilities unless done within min_refresh_interval. Caller holds mtx_.
    void refresh_if_stale_locked();

    ResolverTransport& transport_;
    ResolverOptions options_;
    std::optional<std::chrono::steady_clock::time_point> last_refreshed_;
    std::vector<std::string> capabilities_;
    std::size_t refresh_count_{0};
};

/// Asks a BitTorrent-DHT-backed resolver for @p count peers.
class BtDhtResolverClient : public ResolverClient {
public:
    using ResolverClient::ResolverClient;

    std::vector<spider::Job> request(std::size_t count,
                                     const std::string& ipv = "ip4",
                                     const std::string& when = "now ... future") override;
};

/// Resolves queued web URLs to addresses, @p count at a time.
class WebResolverClient : public ResolverClient {
public:
    WebResolverClient(ResolverTransport& transport,
                      ResolverOptions options,
                      std::vector<std::string> urls = {});

    void extend(const std::vector<std::string>& urls);
    std::size_t queued() const;

    std::vector<spider::Job> request(std::size_t count,
                                     const std::string& ipv = "ip4",
                                     const std::string& when = "now ... future") override;

private:
    std::deque<std::string> queued_;
};

} // namespace pathspider::resolver
