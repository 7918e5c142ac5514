// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/net/FlowKey.h"

#include <arpa/inet.h>
#include <cstring>

namespace pathspider::net {

IpAddress IpAddress::v4(uint32_t host_order) noexcept {
    IpAddress addr;
    addr.version = 4;
    addr.octets[0] = static_cast<uint8_t>((host_order >> 24) & 0xff);
    addr.octets[1] = static_cast<uint8_t>((host_order >> 16) & 0xff);
    addr.octets[2] = static_cast<uint8_t>((host_order >> 8) & 0xff);
    addr.octets[3] = static_cast<uint8_t>(host_order & 0xff);
    return addr;
}

IpAddress IpAddress::v6(const uint8_t* bytes) noexcept {
    IpAddress addr;
    addr.version = 6;
    std::memcpy(addr.octets.data(), bytes, addr.octets.size());
    return addr;
}

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    if (text.empty()) return std::nullopt;

    in_addr v4addr{};
    if (inet_pton(AF_INET, text.c_str(), &v4addr) == 1) {
        return IpAddress::v4(ntohl(v4addr.s_addr));
    }
    in6_addr v6addr{};
    if (inet_pton(AF_INET6, text.c_str(), &v6addr) == 1) {
        return IpAddress::v6(v6addr.s6_addr);
    }
    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (version == 4) {
        inet_ntop(AF_INET, octets.data(), buf, sizeof(buf));
    } else if (version == 6) {
        inet_ntop(AF_INET6, octets.data(), buf, sizeof(buf));
    } else {
        return "-";
    }
    return buf;
}

std::string flow_debug_details(const FlowKey& key) {
    const auto local = key.local_ip.to_string();
    const auto remote = key.remote_ip.to_string();
    std::string tag;
    tag.reserve(local.size() + remote.size() + 24);
    tag.push_back('{');
    tag.append(local);
    tag.push_back(':');
    tag.append(std::to_string(key.local_port));
    tag.push_back('-');
    tag.append(remote);
    tag.push_back(':');
    tag.append(std::to_string(key.remote_port));
    tag.push_back('/');
    tag.append(std::to_string(key.protocol));
    tag.push_back('}');
    return tag;
}

} // namespace pathspider::net
