// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Records.h
 * @brief Jobs, connection outcomes and the active/merged records built from them.
 */
#include "pathspider/net/FlowKey.h"
#include "pathspider/observer/FlowRecord.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pathspider::spider {

/// One target, measured once under each configuration.
struct Job {
    net::IpAddress address{};
    uint16_t port{0};
    std::optional<std::string> host{};
    std::optional<long> rank{};

    std::string describe() const;
};

enum class ConnectionState {
    Ok,
    Failed,
    Timeout
};

const char* to_string(ConnectionState state) noexcept;

/**
 * @brief Owning socket descriptor; closes on destruction.
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Result of a connect attempt: outcome, local port and the open session.
 */
struct Connection {
    ConnectionState state{ConnectionState::Failed};
    uint16_t local_port{0};   ///< Ephemeral port picked by the stack; 0 when unknown.
    std::size_t bytes_sent{0}; ///< Payload already handed over with the SYN (Fast Open).
    FileDescriptor socket{};

    bool ok() const noexcept { return state == ConnectionState::Ok; }

    /// Shut the session down and release the descriptor.
    void close() noexcept;
};

/// Outcome of one (job, configuration) attempt.
struct ActiveRecord {
    net::IpAddress remote_ip{};
    uint16_t remote_port{0};
    uint16_t local_port{0};
    std::optional<std::string> host{};
    std::optional<long> rank{};
    int config{0};
    ConnectionState state{ConnectionState::Failed};
    int result{0};            ///< Protocol-level result, e.g. HTTP status; 0 on error.

    net::ConnectionKey connection_key() const noexcept {
        return net::ConnectionKey{local_port, remote_ip, remote_port};
    }
};

/// Fields every plugin fills the same way.
ActiveRecord make_active_record(const Job& job, const Connection& conn, int config);

/**
 * @brief Correlated output: the active record plus what the observer saw.
 */
struct MergedRecord {
    ActiveRecord active{};
    std::optional<observer::FlowRecord> flow{};   ///< nullopt means unobserved.
    nlohmann::json features = nlohmann::json::object();

    bool observed() const noexcept { return flow.has_value(); }
    nlohmann::json to_json() const;
};

} // namespace pathspider::spider
