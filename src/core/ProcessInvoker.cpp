#include "ProcessInvoker.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace flux_mcp {

namespace {

/**
 * @brief RAII owner of a file descriptor
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

// strerror_r comes in a GNU flavour (returns the text) and an XSI one
// (fills the buffer); std::strerror is not safe across worker threads.
inline std::string describe_error(const char* text, const char*) { return text; }
inline std::string describe_error(int, const char* buffer) { return buffer; }

std::string error_text(int error) {
    char buffer[256] = {};
    return describe_error(::strerror_r(error, buffer, sizeof(buffer)), buffer);
}

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

// Close-on-exec so that children spawned concurrently by other
// invocations never inherit our pipe ends.
Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ToolError(ErrorKind::Infrastructure,
            std::string("Failed to create pipe: ") + error_text(errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

// Sent from child to parent over the status pipe when setup or exec fails.
struct SpawnFailure {
    int stage;  // 0 = chdir, 1 = exec
    int error;
};

[[noreturn]] void child_fail(int status_fd, int stage) {
    SpawnFailure failure{stage, errno};
    ssize_t written = ::write(status_fd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

pid_t wait_for_child(pid_t pid, int& status) {
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    return result;
}

} // namespace

std::string InvocationOutcome::status_description() const {
    if (timed_out) {
        return "timed out";
    }
    if (signaled) {
        const char* name = ::strsignal(term_signal);
        return "signal " + std::to_string(term_signal) + (name ? std::string(" (") + name + ")" : "");
    }
    return "exit code " + std::to_string(exit_code);
}

InvocationOutcome ProcessInvoker::run(const InvocationRequest& request) {
    if (request.program.empty()) {
        throw ToolError(ErrorKind::Infrastructure, "No program given");
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(request.args.size() + 2);
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (const auto& arg : request.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string cwd = request.working_directory.string();

    Pipe out_pipe = make_pipe();
    Pipe err_pipe = make_pipe();
    Pipe status_pipe = make_pipe();

    spdlog::debug("Spawning {} with {} args in '{}'", request.program, request.args.size(), cwd);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ToolError(ErrorKind::Infrastructure,
            std::string("Failed to fork: ") + error_text(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        sigset_t all;
        sigemptyset(&all);
        ::sigprocmask(SIG_SETMASK, &all, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        const int status_fd = status_pipe.write_end.get();

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            child_fail(status_fd, 0);
        }

        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);

        ::execvp(argv[0], argv.data());
        child_fail(status_fd, 1);
    }

    // Parent
    track(pid);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();

    // EOF on the status pipe means exec succeeded.
    SpawnFailure failure{};
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_pipe.read_end.get(), &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        untrack(pid);
        int status = 0;
        wait_for_child(pid, status);
        std::string message = failure.stage == 0
            ? "Cannot change to working directory '" + cwd + "': " + error_text(failure.error)
            : "Cannot execute '" + request.program + "': " + error_text(failure.error);
        spdlog::error("{}", message);
        throw ToolError(ErrorKind::Infrastructure, message);
    }

    spdlog::debug("Child {} started", pid);

    InvocationOutcome outcome;
    std::array<pollfd, 2> fds{};
    fds[0] = {out_pipe.read_end.get(), POLLIN, 0};
    fds[1] = {err_pipe.read_end.get(), POLLIN, 0};
    std::string* sinks[2] = {&outcome.stdout_data, &outcome.stderr_data};

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    std::array<char, 8192> buffer;
    int open_streams = 2;

    while (open_streams > 0) {
        int wait_ms = -1;
        if (request.timeout.count() > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                spdlog::warn("Child {} exceeded timeout of {} ms, killing", pid, request.timeout.count());
                ::kill(pid, SIGKILL);
                outcome.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() failed for child {}: {}", pid, error_text(errno));
            ::kill(pid, SIGKILL);
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF or hard error: stop watching this stream
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    out_pipe.read_end.reset();
    err_pipe.read_end.reset();

    untrack(pid);
    int status = 0;
    if (wait_for_child(pid, status) < 0) {
        throw ToolError(ErrorKind::Infrastructure,
            std::string("Failed to wait for child: ") + error_text(errno));
    }

    if (!outcome.timed_out) {
        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.signaled = true;
            outcome.term_signal = WTERMSIG(status);
        }
    }

    spdlog::debug("Child {} finished: {} (stdout {} bytes, stderr {} bytes)",
        pid, outcome.status_description(), outcome.stdout_data.size(), outcome.stderr_data.size());

    return outcome;
}

std::size_t ProcessInvoker::terminate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (pid_t pid : active_) {
        spdlog::info("Terminating child process {}", pid);
        ::kill(pid, SIGTERM);
    }
    return active_.size();
}

std::size_t ProcessInvoker::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void ProcessInvoker::track(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.insert(pid);
}

// Called before waitpid(): the pid cannot be recycled while it is a zombie.
void ProcessInvoker::untrack(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(pid);
}

std::string resolve_interpreter(const char* virtual_env) {
    if (virtual_env != nullptr && *virtual_env != '\0') {
        return (std::filesystem::path(virtual_env) / "bin" / "python").string();
    }
    return "python3";
}

std::string resolve_interpreter() {
    return resolve_interpreter(std::getenv("VIRTUAL_ENV"));
}

} // namespace flux_mcp
