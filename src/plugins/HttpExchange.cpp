// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/plugins/HttpExchange.h"

#include "pathspider/log/Log.h"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace pathspider::plugins {

namespace {

constexpr std::size_t kMaxStatusLine = 1024;

/// Wait until @p fd is ready for @p events or the deadline passes.
bool wait_ready(int fd, short events, std::chrono::steady_clock::time_point deadline) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return false;
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) return false;
    }
}

} // namespace

std::string build_http_request(const spider::Job& job) {
    const std::string host = job.host ? *job.host : job.address.to_string();
    std::string req;
    req.reserve(96 + host.size());
    req.append("GET / HTTP/1.1\r\n");
    req.append("Host: ").append(host).append("\r\n");
    req.append("User-Agent: ").append(kUserAgent).append("\r\n");
    req.append("Connection: close\r\n\r\n");
    return req;
}

std::optional<int> parse_status_line(const std::string& head) {
    if (head.rfind("HTTP/", 0) != 0) return std::nullopt;
    const auto space = head.find(' ');
    if (space == std::string::npos || space + 4 > head.size()) return std::nullopt;

    int status = 0;
    for (std::size_t i = space + 1; i < space + 4; ++i) {
        const char ch = head[i];
        if (ch < '0' || ch > '9') return std::nullopt;
        status = status * 10 + (ch - '0');
    }
    return status;
}

int http_exchange(int fd,
                  const std::string& request,
                  std::size_t already_sent,
                  std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::size_t offset = already_sent < request.size() ? already_sent : request.size();
    while (offset < request.size()) {
        if (!wait_ready(fd, POLLOUT, deadline)) return 0;
        const ssize_t n = ::send(fd, request.data() + offset, request.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            PSLOG_TRACE("send failed: %s", std::strerror(errno));
            return 0;
        }
        offset += static_cast<std::size_t>(n);
    }

    std::string head;
    char buf[512];
    while (head.find("\r\n") == std::string::npos && head.size() < kMaxStatusLine) {
        if (!wait_ready(fd, POLLIN, deadline)) return 0;
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            PSLOG_TRACE("recv failed: %s", std::strerror(errno));
            return 0;
        }
        if (n == 0) break;
        head.append(buf, static_cast<std::size_t>(n));
    }

    return parse_status_line(head).value_or(0);
}

} // namespace pathspider::plugins
