// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Errors.h
 * @brief Exceptions for conditions that abort a phase or the whole run.
 *
 * Per-job problems (failed connects, broken exchanges) are never thrown past
 * the scheduler; they become values in the ActiveRecord instead.
 */
#include <cstddef>
#include <stdexcept>
#include <string>

namespace pathspider {

/// Capture source missing or unusable; fatal to the run.
class ObserverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A phase's configuration commands could not be applied; fatal to the phase.
class EnvironmentSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed row in the job input.
class JobFormatError : public std::runtime_error {
public:
    JobFormatError(std::size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

    std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

/// Resolver refused or failed a request.
class ResolverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Resolver did not produce a result within the request timeout.
class ResolverTimeout : public ResolverError {
public:
    using ResolverError::ResolverError;
};

} // namespace pathspider
