// EN: Signal Handler for DeployFlow - graceful shutdown that cancels active runs so locks are released
// FR: Gestionnaire de signaux pour DeployFlow - arrêt propre qui annule les runs actifs pour libérer les verrous

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace DPF {

// EN: Callback function type for cleanup operations
// FR: Type de fonction callback pour les opérations de nettoyage
using CleanupCallback = std::function<void()>;

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t cleanup_callbacks_executed{0};
    size_t cleanup_callbacks_failed{0};
    std::chrono::milliseconds last_shutdown_duration{0};
    std::unordered_map<int, size_t> signal_counts; // EN: Count per signal type / FR: Compteur par type de signal
};

// EN: Thread-safe signal handler. The OS handler only writes to a self-pipe; a watcher thread runs callbacks.
// FR: Gestionnaire de signaux thread-safe. Le handler OS écrit dans un self-pipe ; un thread surveillant exécute les callbacks.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    // EN: Register SIGINT and SIGTERM handlers and start the watcher thread.
    // FR: Enregistre les handlers SIGINT et SIGTERM et démarre le thread surveillant.
    void initialize();

    // EN: Register a cleanup callback, run in name order during shutdown
    // FR: Enregistre un callback de nettoyage, exécuté par ordre de nom lors de l'arrêt
    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Manually trigger graceful shutdown (runs callbacks on the calling thread)
    // FR: Déclenche manuellement un arrêt propre (exécute les callbacks sur le thread appelant)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const;

    // EN: Number of the signal that requested shutdown, 0 if none.
    // FR: Numéro du signal ayant demandé l'arrêt, 0 si aucun.
    int getLastSignal() const;

    SignalHandlerStats getStats() const;

    // EN: Restore default handlers, stop the watcher and clear state (mainly for testing)
    // FR: Restaure les handlers par défaut, arrête le surveillant et efface l'état (principalement pour les tests)
    void reset();

    // EN: Enable/disable signal handling (for testing purposes)
    // FR: Active/désactive la gestion des signaux (pour les tests)
    void setEnabled(bool enabled);

    ~SignalHandler();

private:
    SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Async-signal-safe OS callback
    // FR: Callback OS async-signal-safe
    static void signalCallback(int signal_number);

    void watcherLoop();
    void handleSignal(int signal_number);
    void executeCleanupCallbacks();
    void restoreDefaultHandlers();

    mutable std::mutex mutex_;
    SignalHandlerStats stats_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};

    std::map<std::string, CleanupCallback> cleanup_callbacks_;
    std::thread watcher_thread_;

    static int wake_pipe_[2];
};

} // namespace DPF
