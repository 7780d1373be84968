#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

namespace flux_mcp {

/**
 * @brief Delivers process signals to a dedicated thread
 *
 * The constructor blocks the given signals in the calling thread and
 * starts a thread that waits for them with sigwait(). Construct it in
 * main() before any other thread exists so that every thread inherits
 * the blocked mask; the handler then runs as ordinary code, free of
 * async-signal-safety restrictions.
 *
 * Child processes must restore their signal mask after fork()
 * (ProcessInvoker does).
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int signal)>;

    /**
     * @brief Block signals and start watching them
     * @param signals Signals to watch (e.g. SIGINT, SIGTERM)
     * @param handler Called on the watcher thread for each received signal
     * @throws std::system_error if the signal mask cannot be changed
     */
    SignalWatcher(std::initializer_list<int> signals, Handler handler);

    /**
     * @brief Stop the watcher thread
     */
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watch();

    sigset_t signals_;
    int wake_signal_;
    Handler handler_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

} // namespace flux_mcp
