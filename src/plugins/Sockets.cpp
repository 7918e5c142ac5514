// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/plugins/Sockets.h"

#include "pathspider/log/Log.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace pathspider::plugins {

namespace {

using spider::Connection;
using spider::ConnectionState;

bool set_nonblocking(int fd, bool enable) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    const int wanted = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, wanted) == 0;
}

/// Wait for a pending connect to finish; classifies the outcome.
ConnectionState wait_connected(int fd, std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return ConnectionState::Timeout;

        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc == 0) return ConnectionState::Timeout;
        if (rc < 0) {
            if (errno == EINTR) continue;
            return ConnectionState::Failed;
        }
        break;
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) {
        return err == ETIMEDOUT ? ConnectionState::Timeout : ConnectionState::Failed;
    }
    return ConnectionState::Ok;
}

Connection open_socket(const spider::Job& job, sockaddr_storage& addr, socklen_t& addr_len) {
    Connection conn;
    addr_len = make_sockaddr(job.address, job.port, addr);
    if (addr_len == 0) {
        return conn;
    }
    const int fd = ::socket(addr.ss_family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        PSLOG_WARN("socket() failed: %s", std::strerror(errno));
        return conn;
    }
    conn.socket.reset(fd);
    if (!set_nonblocking(fd, true)) {
        conn.socket.reset();
    }
    return conn;
}

void finish_connect(Connection& conn, std::chrono::milliseconds timeout) {
    const int fd = conn.socket.get();
    conn.state = wait_connected(fd, timeout);
    // The kernel bound the ephemeral port with the SYN, even if it went unanswered.
    conn.local_port = local_port_of(fd);
    if (conn.ok() && !set_nonblocking(fd, false)) {
        conn.state = ConnectionState::Failed;
    }
}

} // namespace

socklen_t make_sockaddr(const net::IpAddress& addr, uint16_t port, sockaddr_storage& out) {
    std::memset(&out, 0, sizeof(out));
    if (addr.version == 4) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&out);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, addr.octets.data(), 4);
        return sizeof(sockaddr_in);
    }
    if (addr.version == 6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, addr.octets.data(), 16);
        return sizeof(sockaddr_in6);
    }
    return 0;
}

uint16_t local_port_of(int fd) {
    sockaddr_storage local{};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return 0;
    }
    if (local.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    }
    if (local.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
    }
    return 0;
}

spider::Connection tcp_connect(const spider::Job& job, std::chrono::milliseconds timeout) {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    Connection conn = open_socket(job, addr, addr_len);
    if (!conn.socket.valid()) return conn;

    const int rc = ::connect(conn.socket.get(), reinterpret_cast<const sockaddr*>(&addr), addr_len);
    if (rc != 0 && errno != EINPROGRESS) {
        conn.local_port = local_port_of(conn.socket.get());
        conn.state = ConnectionState::Failed;
        return conn;
    }
    finish_connect(conn, timeout);
    return conn;
}

spider::Connection tcp_fastopen_connect(const spider::Job& job,
                                        const std::string& payload,
                                        std::chrono::milliseconds timeout) {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    Connection conn = open_socket(job, addr, addr_len);
    if (!conn.socket.valid()) return conn;

    const ssize_t sent = ::sendto(conn.socket.get(), payload.data(), payload.size(),
                                  MSG_FASTOPEN | MSG_NOSIGNAL,
                                  reinterpret_cast<const sockaddr*>(&addr), addr_len);
    if (sent < 0 && errno != EINPROGRESS) {
        conn.local_port = local_port_of(conn.socket.get());
        conn.state = ConnectionState::Failed;
        return conn;
    }
    if (sent > 0) {
        conn.bytes_sent = static_cast<std::size_t>(sent);
    }
    finish_connect(conn, timeout);
    return conn;
}

} // namespace pathspider::plugins
