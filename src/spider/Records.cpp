// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Records.h"

#include <sys/socket.h>
#include <unistd.h>

namespace pathspider::spider {

namespace {

nlohmann::json direction_json(const observer::DirectionCounters& c) {
    return nlohmann::json{
        {"packets", c.packets},
        {"octets", c.octets},
        {"payload_octets", c.payload_octets},
    };
}

} // namespace

std::string Job::describe() const {
    std::string text = address.to_string() + ":" + std::to_string(port);
    if (host) {
        text += " (" + *host + ")";
    }
    return text;
}

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Ok:      return "ok";
        case ConnectionState::Failed:  return "failed";
        case ConnectionState::Timeout: return "timeout";
    }
    return "?";
}

void FileDescriptor::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

void Connection::close() noexcept {
    if (socket.valid()) {
        ::shutdown(socket.get(), SHUT_RDWR);
        socket.reset();
    }
}

ActiveRecord make_active_record(const Job& job, const Connection& conn, int config) {
    ActiveRecord rec;
    rec.remote_ip = job.address;
    rec.remote_port = job.port;
    rec.local_port = conn.local_port;
    rec.host = job.host;
    rec.rank = job.rank;
    rec.config = config;
    rec.state = conn.state;
    return rec;
}

nlohmann::json MergedRecord::to_json() const {
    nlohmann::json out;
    out["dip"] = active.remote_ip.to_string();
    out["dp"] = active.remote_port;
    out["sp"] = active.local_port;
    out["host"] = active.host ? nlohmann::json(*active.host) : nlohmann::json(nullptr);
    out["rank"] = active.rank ? nlohmann::json(*active.rank) : nlohmann::json(nullptr);
    out["config"] = active.config;
    out["connstate"] = to_string(active.state);
    out["result"] = active.result;
    out["observed"] = observed();

    if (flow) {
        const auto& m = flow->metrics;
        out["sip"] = flow->key.local_ip.to_string();
        out["ip_version"] = m.ip_version;
        out["proto"] = flow->key.protocol;
        out["first_ns"] = m.first_ns;
        out["last_ns"] = m.last_ns;
        out["fwd"] = direction_json(m.outgoing);
        out["rev"] = direction_json(m.incoming);
        out["finish"] = observer::to_string(flow->reason);
    }
    for (const auto& [key, value] : features.items()) {
        out[key] = value;
    }
    return out;
}

} // namespace pathspider::spider
