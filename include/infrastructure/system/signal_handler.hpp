// EN: Signal handler for ssdctl. Turns SIGINT/SIGTERM into a cancellation request.
// FR: Gestionnaire de signaux pour ssdctl. Transforme SIGINT/SIGTERM en demande d'annulation.

#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace SSD {

// EN: Callback invoked (from a regular thread, never from signal context) when shutdown is requested.
// FR: Callback invoqué (depuis un thread normal, jamais en contexte de signal) lors d'une demande d'arrêt.
using ShutdownCallback = std::function<void(int signal_number)>;

// EN: Singleton signal handler. The C handler only sets an atomic flag; a watcher thread
//     dispatches the registered callbacks. A second signal restores the default action.
// FR: Gestionnaire de signaux singleton. Le handler C ne fait que positionner un flag atomique ;
//     un thread de surveillance dispatche les callbacks. Un second signal restaure l'action par défaut.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    // EN: Install SIGINT/SIGTERM handlers and start the watcher thread. Idempotent.
    // FR: Installe les handlers SIGINT/SIGTERM et démarre le thread de surveillance. Idempotent.
    void initialize();

    void registerShutdownCallback(const std::string& name, ShutdownCallback callback);
    void unregisterShutdownCallback(const std::string& name);

    // EN: Manually trigger shutdown; callbacks run synchronously on the calling thread.
    // FR: Déclenche l'arrêt manuellement ; les callbacks s'exécutent sur le thread appelant.
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const;
    int lastSignal() const;

    // EN: Restore default handlers, stop the watcher and forget callbacks (mainly for tests).
    // FR: Restaure les handlers par défaut, arrête la surveillance et oublie les callbacks (surtout pour les tests).
    void reset();

    ~SignalHandler();

private:
    SignalHandler() = default;
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    static void signalCallback(int signal_number);
    void watcherLoop();
    void dispatch(int signal_number);
    void stopWatcher();

    mutable std::mutex mutex_;
    std::map<std::string, ShutdownCallback> callbacks_;
    std::thread watcher_;
    std::atomic<bool> stop_watcher_{false};
    std::atomic<bool> dispatched_{false};
    bool initialized_ = false;

    static volatile std::sig_atomic_t pending_signal_;
};

} // namespace SSD
