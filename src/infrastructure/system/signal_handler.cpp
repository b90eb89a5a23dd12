// EN: Implementation of the SignalHandler class.
// FR: Implémentation de la classe SignalHandler.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <signal.h>

#include <chrono>
#include <vector>

namespace SSD {

volatile std::sig_atomic_t SignalHandler::pending_signal_ = 0;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::~SignalHandler() {
    stopWatcher();
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    struct sigaction action {};
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    stop_watcher_ = false;
    watcher_ = std::thread(&SignalHandler::watcherLoop, this);
    initialized_ = true;

    SSD_LOG_DEBUG("signal_handler", "SIGINT/SIGTERM handlers installed");
}

void SignalHandler::registerShutdownCallback(const std::string& name, ShutdownCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[name] = std::move(callback);
}

void SignalHandler::unregisterShutdownCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(name);
}

void SignalHandler::triggerShutdown(int signal_number) {
    pending_signal_ = signal_number;
    dispatch(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return pending_signal_ != 0;
}

int SignalHandler::lastSignal() const {
    return static_cast<int>(pending_signal_);
}

void SignalHandler::reset() {
    stopWatcher();

    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        initialized_ = false;
    }
    callbacks_.clear();
    pending_signal_ = 0;
    dispatched_ = false;
}

// EN: Async-signal-safe: only touches a sig_atomic_t and signal dispositions.
// FR: Async-signal-safe : ne touche qu'un sig_atomic_t et les dispositions de signaux.
void SignalHandler::signalCallback(int signal_number) {
    if (pending_signal_ != 0) {
        signal(signal_number, SIG_DFL);
        raise(signal_number);
        return;
    }
    pending_signal_ = signal_number;
}

void SignalHandler::watcherLoop() {
    while (!stop_watcher_.load()) {
        const int signal_number = static_cast<int>(pending_signal_);
        if (signal_number != 0) {
            dispatch(signal_number);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void SignalHandler::dispatch(int signal_number) {
    if (dispatched_.exchange(true)) {
        return;
    }

    SSD_LOG_WARN("signal_handler", "Received signal " + std::to_string(signal_number) +
                 ", cancelling deployment (send again to force exit)");

    std::vector<ShutdownCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, callback] : callbacks_) {
            callbacks.push_back(callback);
        }
    }
    for (const auto& callback : callbacks) {
        callback(signal_number);
    }
}

void SignalHandler::stopWatcher() {
    stop_watcher_ = true;
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

} // namespace SSD
