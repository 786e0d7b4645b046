/**
 * @file ProcessRunner.hpp
 * @brief Runs external command-line tools with a bounded wait.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace audiovault::infrastructure {

/**
 * @struct CommandResult
 * @brief Outcome of one external tool invocation.
 */
struct CommandResult {
    bool started = false;   ///< False when fork/exec failed.
    bool timedOut = false;  ///< True when the child was killed at the deadline.
    int exitCode = -1;      ///< Exit status; -1 when the child did not exit normally.
    std::string output;     ///< Merged stdout/stderr, truncated to a few KiB.

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/**
 * @class ProcessRunner
 * @brief fork/exec wrapper. No shell is involved, so arguments need no quoting.
 */
class ProcessRunner {
public:
    /**
     * @brief Runs argv[0] (looked up on PATH) and waits for it.
     * @param argv Program followed by its arguments.
     * @param timeout Child is killed with SIGKILL once this elapses.
     */
    static CommandResult Run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout);

    /**
     * @brief Resolves an executable the way execvp would.
     * @return Absolute path, or nullopt if no executable entry matches.
     */
    static std::optional<std::string> FindExecutable(const std::string& name);
};

} // namespace audiovault::infrastructure
