// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Records.h"

#include <chrono>
#include <optional>
#include <string>

namespace pathspider::plugins {

constexpr const char* kUserAgent = "pathspider";

/// "GET / HTTP/1.1" with Host, User-Agent and Connection: close.
std::string build_http_request(const spider::Job& job);

/**
 * @brief Status code from the first line of an HTTP response, e.g.
 *        "HTTP/1.1 200 OK" -> 200. nullopt when the line is not HTTP.
 */
std::optional<int> parse_status_line(const std::string& head);

/**
 * @brief Send @p request (skipping the first @p already_sent bytes) on a
 *        connected blocking socket and read the response status.
 *
 * @return the status code, or 0 on any error or when @p timeout expires.
 */
int http_exchange(int fd,
                  const std::string& request,
                  std::size_t already_sent,
                  std::chrono::milliseconds timeout);

} // namespace pathspider::plugins
