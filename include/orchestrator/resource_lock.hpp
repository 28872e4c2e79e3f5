#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "orchestrator/cancellation.hpp"

namespace DPF {
namespace Orchestrator {

// EN: Outcome of a provider-level acquisition attempt.
// FR: Résultat d'une tentative d'acquisition au niveau du fournisseur.
enum class LockAcquireStatus {
    ACQUIRED = 0,
    TIMED_OUT = 1,
    CANCELLED = 2
};

// EN: Backing implementation of named exclusive locks. Waiter order is best-effort (no fairness).
// FR: Implémentation sous-jacente de verrous exclusifs nommés. Ordre des attentes au mieux (pas d'équité).
class ResourceLockProvider {
public:
    virtual ~ResourceLockProvider() = default;

    // EN: Block until `name` is held by `holder`, the timeout expires or `cancel` fires.
    // FR: Bloque jusqu'à ce que `name` soit détenu par `holder`, l'expiration du timeout ou l'annulation.
    virtual LockAcquireStatus acquire(const std::string& name, const std::string& holder,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken& cancel) = 0;

    // EN: Release `name` if (and only if) `holder` owns it. Returns false otherwise.
    // FR: Libère `name` si (et seulement si) `holder` le détient. Retourne false sinon.
    virtual bool release(const std::string& name, const std::string& holder) = 0;

    // EN: Current holder description, nullopt when free.
    // FR: Description du détenteur courant, nullopt si libre.
    virtual std::optional<std::string> currentHolder(const std::string& name) const = 0;

    virtual std::string backendName() const = 0;
};

// EN: Locks shared by every run of this process (mutex + condition variable).
// FR: Verrous partagés par tous les runs de ce processus (mutex + variable de condition).
class InProcessLockProvider : public ResourceLockProvider {
public:
    LockAcquireStatus acquire(const std::string& name, const std::string& holder,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& cancel) override;
    bool release(const std::string& name, const std::string& holder) override;
    std::optional<std::string> currentHolder(const std::string& name) const override;
    std::string backendName() const override { return "memory"; }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_map<std::string, std::string> holders_;
};

// EN: One flock(2)-protected file per lock name, so runs in different processes serialize.
// EN: The lock file carries JSON holder metadata (holder, pid, host, acquired_at) for diagnostics.
// FR: Un fichier protégé par flock(2) par nom de verrou, pour sérialiser des runs de processus différents.
// FR: Le fichier contient les métadonnées JSON du détenteur (holder, pid, host, acquired_at).
class FileLockProvider : public ResourceLockProvider {
public:
    explicit FileLockProvider(std::string directory,
                              std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~FileLockProvider() override;

    FileLockProvider(const FileLockProvider&) = delete;
    FileLockProvider& operator=(const FileLockProvider&) = delete;

    LockAcquireStatus acquire(const std::string& name, const std::string& holder,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& cancel) override;
    bool release(const std::string& name, const std::string& holder) override;
    std::optional<std::string> currentHolder(const std::string& name) const override;
    std::string backendName() const override { return "file"; }

    std::string lockFilePath(const std::string& name) const;
    const std::string& directory() const { return directory_; }

private:
    struct HeldLock {
        int fd = -1;
        std::string holder;
    };

    // EN: Open the lock file and try a non-blocking exclusive flock. Returns the fd or -1 when busy.
    // FR: Ouvre le fichier de verrou et tente un flock exclusif non bloquant. Retourne le fd ou -1 si occupé.
    int tryLockFile(const std::string& path) const;
    void writeHolderMetadata(int fd, const std::string& name, const std::string& holder) const;

    std::string directory_;
    std::chrono::milliseconds poll_interval_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, HeldLock> held_;
};

class ResourceLockManager;

// EN: RAII ownership of a named lock. Move-only; released exactly once (destructor or release()).
// FR: Possession RAII d'un verrou nommé. Déplaçable uniquement ; libéré exactement une fois.
class LockToken {
public:
    LockToken() = default;
    ~LockToken();

    LockToken(LockToken&& other) noexcept;
    LockToken& operator=(LockToken&& other) noexcept;
    LockToken(const LockToken&) = delete;
    LockToken& operator=(const LockToken&) = delete;

    void release();
    bool ownsLock() const { return manager_ != nullptr; }

    const std::string& name() const { return name_; }
    const std::string& holder() const { return holder_; }
    std::chrono::milliseconds waited() const { return waited_; }

private:
    friend class ResourceLockManager;
    LockToken(ResourceLockManager* manager, std::string name, std::string holder,
              std::chrono::milliseconds waited);

    ResourceLockManager* manager_ = nullptr;
    std::string name_;
    std::string holder_;
    std::chrono::milliseconds waited_{0};
    std::chrono::steady_clock::time_point acquired_at_;
};

// EN: Per-lock statistics.
// FR: Statistiques par verrou.
struct ResourceLockStats {
    size_t acquisitions = 0;
    size_t timeouts = 0;
    size_t cancellations = 0;
    size_t waiting = 0;                         // EN: Current waiters / FR: Attentes en cours
    bool held = false;
    std::chrono::milliseconds total_wait{0};
    std::chrono::milliseconds max_wait{0};
    std::chrono::milliseconds total_held{0};
};

// EN: Mutex Manager: the only cross-run shared mutable state. Wraps a provider with
// EN: exception-based timeouts, RAII tokens, logging and statistics.
// FR: Gestionnaire de mutex : le seul état mutable partagé entre runs. Enveloppe un fournisseur
// FR: avec timeouts par exception, tokens RAII, logs et statistiques.
class ResourceLockManager {
public:
    explicit ResourceLockManager(std::shared_ptr<ResourceLockProvider> provider);

    // EN: Acquire `name` for `holder`. Throws LockAcquisitionTimeout or LockAcquisitionCancelled;
    // EN: in both cases nothing is held afterwards.
    // FR: Acquiert `name` pour `holder`. Lève LockAcquisitionTimeout ou LockAcquisitionCancelled ;
    // FR: dans les deux cas rien n'est détenu ensuite.
    LockToken acquire(const std::string& name, std::chrono::milliseconds timeout,
                      const std::string& holder, const CancellationToken& cancel = CancellationToken());

    std::optional<std::string> currentHolder(const std::string& name) const;

    ResourceLockStats getStats(const std::string& name) const;
    std::map<std::string, ResourceLockStats> getAllStats() const;

    ResourceLockProvider& provider() { return *provider_; }
    const ResourceLockProvider& provider() const { return *provider_; }

private:
    friend class LockToken;
    void release(const std::string& name, const std::string& holder, std::chrono::milliseconds held_for);

    std::shared_ptr<ResourceLockProvider> provider_;
    mutable std::mutex stats_mutex_;
    std::map<std::string, ResourceLockStats> stats_;
};

namespace ResourceLockUtils {

// EN: Create a provider for a backend name ("file" or "memory"). Throws std::invalid_argument otherwise.
// FR: Crée un fournisseur pour un nom de backend ("file" ou "memory"). Lève std::invalid_argument sinon.
std::shared_ptr<ResourceLockProvider> createProvider(const std::string& backend, const std::string& directory);

// EN: Lock names become file names: characters outside [A-Za-z0-9._-] are replaced by '_'.
// FR: Les noms de verrous deviennent des noms de fichiers : les caractères hors [A-Za-z0-9._-] deviennent '_'.
std::string sanitizeLockName(const std::string& name);

std::string statusToString(LockAcquireStatus status);

} // namespace ResourceLockUtils

} // namespace Orchestrator
} // namespace DPF
