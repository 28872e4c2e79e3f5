// EN: Implementation of the SignalHandler class. SIGINT/SIGTERM trigger the registered cleanup callbacks.
// FR: Implémentation de la classe SignalHandler. SIGINT/SIGTERM déclenchent les callbacks de nettoyage enregistrés.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace DPF {

int SignalHandler::wake_pipe_[2] = {-1, -1};

namespace {
// EN: Byte written to the pipe to stop the watcher thread instead of reporting a signal.
// FR: Octet écrit dans le pipe pour arrêter le surveillant au lieu de signaler un signal.
constexpr unsigned char kStopWatcher = 0;
}

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() {
    stats_.created_at = std::chrono::system_clock::now();
}

SignalHandler::~SignalHandler() {
    reset();
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, skipping initialization");
        return;
    }

    if (pipe(wake_pipe_) != 0) {
        throw std::runtime_error("Failed to create signal pipe: " + std::string(std::strerror(errno)));
    }
    fcntl(wake_pipe_[0], F_SETFD, FD_CLOEXEC);
    fcntl(wake_pipe_[1], F_SETFD, FD_CLOEXEC);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register signal handlers");
        restoreDefaultHandlers();
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        wake_pipe_[0] = wake_pipe_[1] = -1;
        throw std::runtime_error("Failed to register SIGINT/SIGTERM handlers");
    }

    watcher_thread_ = std::thread(&SignalHandler::watcherLoop, this);
    initialized_ = true;

    LOG_DEBUG("signal_handler", "SignalHandler initialized - SIGINT and SIGTERM handlers registered");
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_[name] = std::move(callback);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_.erase(name);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::triggerShutdown(int signal_number) {
    handleSignal(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return shutdown_requested_.load();
}

int SignalHandler::getLastSignal() const {
    return last_signal_.load();
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SignalHandler::reset() {
    if (initialized_.exchange(false)) {
        restoreDefaultHandlers();

        unsigned char stop = kStopWatcher;
        if (write(wake_pipe_[1], &stop, 1) != 1) {
            LOG_WARN("signal_handler", "Failed to wake signal watcher: " + std::string(std::strerror(errno)));
        }
        if (watcher_thread_.joinable()) {
            watcher_thread_.join();
        }
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        wake_pipe_[0] = wake_pipe_[1] = -1;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_.clear();
    shutdown_requested_ = false;
    last_signal_ = 0;
    stats_ = SignalHandlerStats{};
    stats_.created_at = std::chrono::system_clock::now();
}

void SignalHandler::setEnabled(bool enabled) {
    enabled_ = enabled;
}

// EN: Only async-signal-safe calls are allowed here.
// FR: Seuls les appels async-signal-safe sont autorisés ici.
void SignalHandler::signalCallback(int signal_number) {
    int saved_errno = errno;
    if (wake_pipe_[1] >= 0) {
        unsigned char byte = static_cast<unsigned char>(signal_number);
        ssize_t ignored = write(wake_pipe_[1], &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

void SignalHandler::watcherLoop() {
    while (true) {
        unsigned char byte = 0;
        ssize_t n = read(wake_pipe_[0], &byte, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0 || byte == kStopWatcher) {
            break;
        }
        handleSignal(static_cast<int>(byte));
    }
}

void SignalHandler::handleSignal(int signal_number) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.signals_received++;
        stats_.signal_counts[signal_number]++;
    }

    last_signal_ = signal_number;
    if (shutdown_requested_.exchange(true)) {
        LOG_WARN("signal_handler", "Signal " + std::to_string(signal_number) +
                 " received while shutdown already in progress");
        return;
    }

    LOG_WARN("signal_handler", "Signal " + std::to_string(signal_number) + " received, shutting down");

    auto start = std::chrono::steady_clock::now();
    executeCleanupCallbacks();

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.last_shutdown_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

// EN: Callbacks run outside the lock so they may register or unregister callbacks.
// FR: Les callbacks s'exécutent hors verrou pour pouvoir (dés)enregistrer des callbacks.
void SignalHandler::executeCleanupCallbacks() {
    std::vector<std::pair<std::string, CleanupCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.assign(cleanup_callbacks_.begin(), cleanup_callbacks_.end());
    }

    for (const auto& [name, callback] : callbacks) {
        try {
            callback();
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.cleanup_callbacks_executed++;
        } catch (const std::exception& e) {
            LOG_ERROR("signal_handler", "Cleanup callback '" + name + "' failed: " + e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.cleanup_callbacks_failed++;
        }
    }
}

void SignalHandler::restoreDefaultHandlers() {
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
}

} // namespace DPF
