#include "orchestrator/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace DPF {
namespace Orchestrator {

bool CancellationToken::isCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

std::string CancellationToken::reason() const {
    if (!state_) {
        return "";
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->condition.wait_for(lock, duration, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    if (!parent.state_) {
        return;
    }

    std::string parent_reason;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        if (!parent.state_->cancelled) {
            // EN: Drop expired children while we are here.
            // FR: Supprime les enfants expirés au passage.
            auto& children = parent.state_->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<detail::CancellationState>& c) { return c.expired(); }),
                           children.end());
            children.push_back(state_);
            return;
        }
        parent_reason = parent.state_->reason;
    }
    cancelState(state_, parent_reason);
}

bool CancellationSource::cancel(const std::string& reason) {
    return cancelState(state_, reason);
}

bool CancellationSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationSource::cancelState(const std::shared_ptr<detail::CancellationState>& state,
                                     const std::string& reason) {
    std::vector<std::weak_ptr<detail::CancellationState>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) {
            return false;
        }
        state->cancelled = true;
        state->reason = reason;
        children.swap(state->children);
    }
    state->condition.notify_all();

    for (const auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            cancelState(child, reason);
        }
    }
    return true;
}

} // namespace Orchestrator
} // namespace DPF
