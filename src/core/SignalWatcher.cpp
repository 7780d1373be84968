#include "SignalWatcher.hpp"
#include <spdlog/spdlog.h>
#include <pthread.h>
#include <stdexcept>
#include <system_error>

namespace flux_mcp {

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Handler handler)
    : handler_(std::move(handler)) {
    if (signals.size() == 0) {
        throw std::invalid_argument("SignalWatcher needs at least one signal");
    }
    if (!handler_) {
        throw std::invalid_argument("Signal handler cannot be null");
    }

    sigemptyset(&signals_);
    for (int signal : signals) {
        sigaddset(&signals_, signal);
    }
    wake_signal_ = *signals.begin();

    int rc = ::pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }

    thread_ = std::thread([this] { watch(); });
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    if (thread_.joinable()) {
        // The signal is blocked everywhere, so it stays pending for sigwait()
        ::pthread_kill(thread_.native_handle(), wake_signal_);
        thread_.join();
    }
}

void SignalWatcher::watch() {
    while (true) {
        int signal = 0;
        int rc = ::sigwait(&signals_, &signal);
        if (stopping_) {
            return;
        }
        if (rc != 0) {
            spdlog::error("sigwait failed: {}", rc);
            return;
        }
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        handler_(signal);
    }
}

} // namespace flux_mcp
