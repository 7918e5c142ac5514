// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Environment.h
 * @brief Privileged per-phase configuration (e.g. sysctl) behind one interface.
 */
#include <string>
#include <vector>

namespace pathspider::spider {

/// argv of a single command, argv[0] resolved through PATH.
using Command = std::vector<std::string>;
using CommandList = std::vector<Command>;

/**
 * @brief Exit status and combined stdout/stderr of a child process.
 */
struct CommandResult {
    int status{-1};        ///< Exit code, or -1 when the child could not be run.
    std::string output;
};

/// fork/exec @p argv, wait for it and capture its output.
CommandResult run_command(const Command& argv);

std::string join_command(const Command& argv);

/**
 * @brief Applies the configuration commands of a phase.
 *
 * Called by the scheduler only, between phases, with no job in flight.
 */
class EnvironmentSetup {
public:
    virtual ~EnvironmentSetup() = default;

    /**
     * @throws EnvironmentSetupError if any command fails.
     */
    virtual void apply(int config, const CommandList& commands) = 0;
};

/// Runs every command and fails on the first non-zero exit.
class CommandEnvironment : public EnvironmentSetup {
public:
    void apply(int config, const CommandList& commands) override;
};

/// Logs what would run and does nothing (--no-env).
class NoopEnvironment : public EnvironmentSetup {
public:
    void apply(int config, const CommandList& commands) override;
};

} // namespace pathspider::spider
