// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Sockets.h
 * @brief Timeout-bounded TCP connects used by the plugins.
 */
#include "pathspider/spider/Records.h"

#include <sys/socket.h>

#include <chrono>
#include <string>

namespace pathspider::plugins {

/// Fill @p out for @p addr / @p port; returns the address length, 0 when unset.
socklen_t make_sockaddr(const net::IpAddress& addr, uint16_t port, sockaddr_storage& out);

/// Local port of a bound socket, 0 when unknown.
uint16_t local_port_of(int fd);

/**
 * @brief Plain TCP connect bounded by @p timeout.
 *
 * The returned socket is back in blocking mode on success.
 */
spider::Connection tcp_connect(const spider::Job& job, std::chrono::milliseconds timeout);

/**
 * @brief TCP Fast Open connect: @p payload rides on the SYN when the kernel
 *        holds a cookie for the destination, otherwise the SYN requests one.
 */
spider::Connection tcp_fastopen_connect(const spider::Job& job,
                                        const std::string& payload,
                                        std::chrono::milliseconds timeout);

} // namespace pathspider::plugins
