// EN: Resource lock providers and the Mutex Manager guarding shared external resources across runs.
// FR: Fournisseurs de verrous de ressources et gestionnaire de mutex protégeant les ressources externes partagées.

#include "orchestrator/resource_lock.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace DPF {
namespace Orchestrator {

namespace {

std::string hostName() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

// ============================================================================
// InProcessLockProvider
// ============================================================================

LockAcquireStatus InProcessLockProvider::acquire(const std::string& name, const std::string& holder,
                                                 std::chrono::milliseconds timeout,
                                                 const CancellationToken& cancel) {
    // EN: Cancellation is polled; the condition variable only reports releases.
    // FR: L'annulation est scrutée ; la variable de condition ne signale que les libérations.
    constexpr auto kCancelPoll = std::chrono::milliseconds(25);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (holders_.find(name) != holders_.end()) {
        if (cancel.isCancelled()) {
            return LockAcquireStatus::CANCELLED;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return LockAcquireStatus::TIMED_OUT;
        }
        released_.wait_until(lock, std::min(deadline, now + kCancelPoll));
    }

    if (cancel.isCancelled()) {
        return LockAcquireStatus::CANCELLED;
    }

    holders_[name] = holder;
    return LockAcquireStatus::ACQUIRED;
}

bool InProcessLockProvider::release(const std::string& name, const std::string& holder) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = holders_.find(name);
        if (it == holders_.end() || it->second != holder) {
            return false;
        }
        holders_.erase(it);
    }
    released_.notify_all();
    return true;
}

std::optional<std::string> InProcessLockProvider::currentHolder(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holders_.find(name);
    if (it == holders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// FileLockProvider
// ============================================================================

FileLockProvider::FileLockProvider(std::string directory, std::chrono::milliseconds poll_interval)
    : directory_(std::move(directory)), poll_interval_(poll_interval) {
    if (directory_.empty()) {
        throw std::invalid_argument("FileLockProvider requires a lock directory");
    }
    std::filesystem::create_directories(directory_);
}

FileLockProvider::~FileLockProvider() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, held] : held_) {
        LOG_WARN("locks", "Releasing lock '" + name + "' still held by " + held.holder + " at shutdown");
        flock(held.fd, LOCK_UN);
        close(held.fd);
    }
    held_.clear();
}

std::string FileLockProvider::lockFilePath(const std::string& name) const {
    return (std::filesystem::path(directory_) / (ResourceLockUtils::sanitizeLockName(name) + ".lock")).string();
}

int FileLockProvider::tryLockFile(const std::string& path) const {
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot open lock file " + path + ": " + std::strerror(errno));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
        return fd;
    }

    int error = errno;
    close(fd);
    if (error == EWOULDBLOCK || error == EINTR) {
        return -1;
    }
    throw std::runtime_error("flock failed on " + path + ": " + std::strerror(error));
}

void FileLockProvider::writeHolderMetadata(int fd, const std::string& name, const std::string& holder) const {
    nlohmann::json metadata = {
        {"lock", name},
        {"holder", holder},
        {"pid", static_cast<long>(getpid())},
        {"host", hostName()},
        {"acquired_at", Logger::timestampToISO8601(std::chrono::system_clock::now())}
    };
    std::string content = metadata.dump() + "\n";

    if (ftruncate(fd, 0) != 0 ||
        pwrite(fd, content.data(), content.size(), 0) != static_cast<ssize_t>(content.size())) {
        LOG_WARN("locks", "Could not write holder metadata for lock '" + name + "': " + std::strerror(errno));
    }
}

LockAcquireStatus FileLockProvider::acquire(const std::string& name, const std::string& holder,
                                            std::chrono::milliseconds timeout,
                                            const CancellationToken& cancel) {
    const std::string path = lockFilePath(name);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (cancel.isCancelled()) {
            return LockAcquireStatus::CANCELLED;
        }

        int fd = tryLockFile(path);
        if (fd >= 0) {
            writeHolderMetadata(fd, name, holder);
            std::lock_guard<std::mutex> lock(mutex_);
            held_[name] = HeldLock{fd, holder};
            return LockAcquireStatus::ACQUIRED;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return LockAcquireStatus::TIMED_OUT;
        }

        auto slice = std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now);
        if (cancel.waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(slice) +
                           std::chrono::milliseconds(1))) {
            return LockAcquireStatus::CANCELLED;
        }
    }
}

bool FileLockProvider::release(const std::string& name, const std::string& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(name);
    if (it == held_.end() || it->second.holder != holder) {
        return false;
    }

    int fd = it->second.fd;
    held_.erase(it);

    // EN: Empty the file first so a stale reader never sees a released holder.
    // FR: Vide le fichier d'abord pour qu'un lecteur ne voie jamais un détenteur libéré.
    if (ftruncate(fd, 0) != 0) {
        LOG_WARN("locks", "Could not clear lock file for '" + name + "': " + std::strerror(errno));
    }
    flock(fd, LOCK_UN);
    close(fd);
    return true;
}

std::optional<std::string> FileLockProvider::currentHolder(const std::string& name) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(name);
        if (it != held_.end()) {
            return it->second.holder;
        }
    }

    const std::string path = lockFilePath(name);
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::nullopt;
    }

    if (flock(fd, LOCK_SH | LOCK_NB) == 0) {
        flock(fd, LOCK_UN);
        close(fd);
        return std::nullopt;
    }

    std::string content;
    char buffer[512];
    ssize_t n = 0;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(n));
    }
    close(fd);

    nlohmann::json metadata = nlohmann::json::parse(content, nullptr, false);
    if (metadata.is_object() && metadata.contains("holder") && metadata["holder"].is_string()) {
        std::string description = metadata["holder"].get<std::string>();
        if (metadata.contains("pid") && metadata.contains("host")) {
            description += " (pid " + metadata["pid"].dump() + " on " + metadata["host"].get<std::string>() + ")";
        }
        return description;
    }
    return std::string("unknown holder");
}

// ============================================================================
// LockToken
// ============================================================================

LockToken::LockToken(ResourceLockManager* manager, std::string name, std::string holder,
                     std::chrono::milliseconds waited)
    : manager_(manager), name_(std::move(name)), holder_(std::move(holder)), waited_(waited),
      acquired_at_(std::chrono::steady_clock::now()) {}

LockToken::~LockToken() {
    release();
}

LockToken::LockToken(LockToken&& other) noexcept
    : manager_(other.manager_), name_(std::move(other.name_)), holder_(std::move(other.holder_)),
      waited_(other.waited_), acquired_at_(other.acquired_at_) {
    other.manager_ = nullptr;
}

LockToken& LockToken::operator=(LockToken&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        name_ = std::move(other.name_);
        holder_ = std::move(other.holder_);
        waited_ = other.waited_;
        acquired_at_ = other.acquired_at_;
        other.manager_ = nullptr;
    }
    return *this;
}

void LockToken::release() {
    if (!manager_) {
        return;
    }
    ResourceLockManager* manager = manager_;
    manager_ = nullptr;
    manager->release(name_, holder_, elapsedSince(acquired_at_));
}

// ============================================================================
// ResourceLockManager
// ============================================================================

ResourceLockManager::ResourceLockManager(std::shared_ptr<ResourceLockProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("ResourceLockManager requires a provider");
    }
}

LockToken ResourceLockManager::acquire(const std::string& name, std::chrono::milliseconds timeout,
                                       const std::string& holder, const CancellationToken& cancel) {
    if (name.empty()) {
        throw std::invalid_argument("Resource lock name must not be empty");
    }

    const auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_[name].waiting++;
    }

    LOG_DEBUG_META("locks", "Waiting for lock", (std::unordered_map<std::string, std::string>{
        {"lock", name}, {"holder", holder}, {"timeout_ms", std::to_string(timeout.count())}}));

    LockAcquireStatus status;
    try {
        status = provider_->acquire(name, holder, timeout, cancel);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_[name].waiting--;
        LOG_ERROR("locks", "Lock backend failure for '" + name + "': " + e.what());
        throw;
    }

    const auto waited = elapsedSince(start);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ResourceLockStats& stats = stats_[name];
        stats.waiting--;
        stats.total_wait += waited;
        stats.max_wait = std::max(stats.max_wait, waited);
        switch (status) {
            case LockAcquireStatus::ACQUIRED: stats.acquisitions++; stats.held = true; break;
            case LockAcquireStatus::TIMED_OUT: stats.timeouts++; break;
            case LockAcquireStatus::CANCELLED: stats.cancellations++; break;
        }
    }

    std::unordered_map<std::string, std::string> meta = {
        {"lock", name}, {"holder", holder}, {"waited_ms", std::to_string(waited.count())},
        {"backend", provider_->backendName()}};

    switch (status) {
        case LockAcquireStatus::ACQUIRED:
            LOG_INFO_META("locks", "Lock acquired", meta);
            return LockToken(this, name, holder, waited);
        case LockAcquireStatus::TIMED_OUT:
            LOG_WARN_META("locks", "Lock acquisition timed out", meta);
            throw LockAcquisitionTimeout(name, waited);
        case LockAcquireStatus::CANCELLED:
        default:
            LOG_INFO_META("locks", "Lock acquisition cancelled", meta);
            throw LockAcquisitionCancelled(name, waited);
    }
}

void ResourceLockManager::release(const std::string& name, const std::string& holder,
                                  std::chrono::milliseconds held_for) {
    if (!provider_->release(name, holder)) {
        LOG_ERROR("locks", "Lock '" + name + "' was not held by " + holder + " at release");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ResourceLockStats& stats = stats_[name];
        stats.held = false;
        stats.total_held += held_for;
    }

    LOG_INFO_META("locks", "Lock released", (std::unordered_map<std::string, std::string>{
        {"lock", name}, {"holder", holder}, {"held_ms", std::to_string(held_for.count())}}));
}

std::optional<std::string> ResourceLockManager::currentHolder(const std::string& name) const {
    return provider_->currentHolder(name);
}

ResourceLockStats ResourceLockManager::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto it = stats_.find(name);
    return it != stats_.end() ? it->second : ResourceLockStats{};
}

std::map<std::string, ResourceLockStats> ResourceLockManager::getAllStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// ResourceLockUtils
// ============================================================================

namespace ResourceLockUtils {

std::shared_ptr<ResourceLockProvider> createProvider(const std::string& backend, const std::string& directory) {
    if (backend == "memory") {
        return std::make_shared<InProcessLockProvider>();
    }
    if (backend == "file") {
        return std::make_shared<FileLockProvider>(directory);
    }
    throw std::invalid_argument("Unknown lock backend '" + backend + "' (expected 'file' or 'memory')");
}

std::string sanitizeLockName(const std::string& name) {
    std::string sanitized = name;
    bool changed = false;
    for (char& c : sanitized) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            c = '_';
            changed = true;
        }
    }

    // EN: Keep distinct names distinct once special characters are replaced.
    // FR: Garde distincts les noms distincts une fois les caractères spéciaux remplacés.
    if (changed || sanitized.empty() || sanitized[0] == '.') {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(name.data()), static_cast<uInt>(name.size()));
        std::ostringstream oss;
        oss << sanitized << "-" << std::hex << std::setw(8) << std::setfill('0') << crc;
        return oss.str();
    }
    return sanitized;
}

std::string statusToString(LockAcquireStatus status) {
    switch (status) {
        case LockAcquireStatus::ACQUIRED: return "ACQUIRED";
        case LockAcquireStatus::TIMED_OUT: return "TIMED_OUT";
        case LockAcquireStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

} // namespace ResourceLockUtils

} // namespace Orchestrator
} // namespace DPF
