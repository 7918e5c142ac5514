// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/spider/Environment.h"

#include "pathspider/Errors.h"
#include "pathspider/log/Log.h"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

namespace pathspider::spider {

std::string join_command(const Command& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) text.push_back(' ');
        text.append(arg);
    }
    return text;
}

CommandResult run_command(const Command& argv) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    // The child of a multi-threaded parent may only make async-signal-safe
    // calls, so argv is built here.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdout and stderr both go to the pipe.
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(pipefd[1]);
    char buf[512];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR)) {
        if (n > 0) result.output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return result;
    }
    result.status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

void CommandEnvironment::apply(int config, const CommandList& commands) {
    for (const auto& cmd : commands) {
        PSLOG_INFO("config %d: %s", config, join_command(cmd).c_str());
        const auto res = run_command(cmd);
        if (res.status != 0) {
            std::string msg = "config " + std::to_string(config) + ": '" + join_command(cmd) +
                              "' exited with " + std::to_string(res.status);
            if (!res.output.empty()) {
                msg += ": " + res.output;
            }
            throw EnvironmentSetupError(msg);
        }
    }
}

void NoopEnvironment::apply(int config, const CommandList& commands) {
    for (const auto& cmd : commands) {
        PSLOG_DEBUG("config %d: skipping '%s'", config, join_command(cmd).c_str());
    }
}

} // namespace pathspider::spider
