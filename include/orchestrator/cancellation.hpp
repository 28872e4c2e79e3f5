#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DPF {
namespace Orchestrator {

namespace detail {
    // EN: Shared cancellation state. Children are cancelled together with their parent.
    // FR: État d'annulation partagé. Les enfants sont annulés avec leur parent.
    struct CancellationState {
        std::mutex mutex;
        std::condition_variable condition;
        bool cancelled = false;
        std::string reason;
        std::vector<std::weak_ptr<CancellationState>> children;
    };
}

// EN: Read side of a cancellation request. A default-constructed token is never cancelled.
// FR: Côté lecture d'une demande d'annulation. Un token construit par défaut n'est jamais annulé.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;
    std::string reason() const;

    // EN: Sleep up to `duration`; returns true as soon as cancellation is requested.
    // FR: Dort jusqu'à `duration` ; retourne true dès que l'annulation est demandée.
    bool waitFor(std::chrono::milliseconds duration) const;

    // EN: Whether the token can ever be cancelled.
    // FR: Indique si le token peut être annulé.
    bool canBeCancelled() const { return static_cast<bool>(state_); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// EN: Write side of a cancellation request. A source linked to a parent token is cancelled with it.
// FR: Côté écriture d'une demande d'annulation. Une source liée à un token parent est annulée avec lui.
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);

    // EN: Request cancellation; the first reason wins. Returns false if already cancelled.
    // FR: Demande l'annulation ; la première raison l'emporte. Retourne false si déjà annulé.
    bool cancel(const std::string& reason = "cancelled");

    bool isCancelled() const;
    CancellationToken token() const { return CancellationToken(state_); }

private:
    static bool cancelState(const std::shared_ptr<detail::CancellationState>& state, const std::string& reason);

    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace Orchestrator
} // namespace DPF
