#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <sys/types.h>

namespace flux_mcp {

/**
 * @brief One external program execution request
 *
 * The environment is always inherited from the server process.
 */
struct InvocationRequest {
    std::string program;                    // Executable name or path (PATH lookup if no slash)
    std::vector<std::string> args;          // argv without the program name
    std::filesystem::path working_directory;
    std::chrono::milliseconds timeout{0};   // 0 = wait indefinitely
};

/**
 * @brief Terminal state of a finished child process
 */
struct InvocationOutcome {
    int exit_code = -1;     // Valid when !signaled && !timed_out
    bool signaled = false;
    int term_signal = 0;
    bool timed_out = false;
    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief True if the process exited normally with status 0
     */
    bool succeeded() const { return !signaled && !timed_out && exit_code == 0; }

    /**
     * @brief Describe the exit status, e.g. "exit code 1" or "signal 9"
     */
    std::string status_description() const;
};

/**
 * @brief Spawns child processes and captures their output
 *
 * Each run() call is independent: it forks one child, drains stdout and
 * stderr concurrently until both reach EOF, and reaps the child before
 * returning. The only shared state is the set of live child pids, used
 * by terminate_all() during shutdown.
 */
class ProcessInvoker {
public:
    ProcessInvoker() = default;

    ProcessInvoker(const ProcessInvoker&) = delete;
    ProcessInvoker& operator=(const ProcessInvoker&) = delete;

    /**
     * @brief Run a program to completion
     *
     * @param request Program, arguments, working directory and timeout
     * @return Exit status with both captured streams
     * @throws ToolError (ErrorKind::Infrastructure) if the program cannot be started
     */
    InvocationOutcome run(const InvocationRequest& request);

    /**
     * @brief Send SIGTERM to every child that is still running
     * @return Number of children signalled
     */
    std::size_t terminate_all();

    /**
     * @brief Number of children currently running
     */
    std::size_t active_count() const;

private:
    void track(pid_t pid);
    void untrack(pid_t pid);

    mutable std::mutex mutex_;
    std::set<pid_t> active_;
};

/**
 * @brief Resolve the Python interpreter for a given VIRTUAL_ENV value
 *
 * @param virtual_env Value of VIRTUAL_ENV, may be null
 * @return "<virtual_env>/bin/python" if set and non-empty, else "python3"
 */
std::string resolve_interpreter(const char* virtual_env);

/**
 * @brief Resolve the Python interpreter from the current environment
 *
 * Reads VIRTUAL_ENV on every call; nothing is cached.
 */
std::string resolve_interpreter();

} // namespace flux_mcp
