// EN: Cooperative cancellation source and token
// FR: Source et jeton d'annulation coopérative

#include "infrastructure/system/cancellation.hpp"

#include <vector>

namespace CKW {

bool CancellationToken::isCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

std::size_t CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            const std::size_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::removeCallback(std::size_t registration_id) const {
    if (!state_) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(registration_id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

// EN: Callbacks run outside the lock so they may touch the token again.
// FR: Les callbacks s'exécutent hors verrou pour pouvoir réutiliser le jeton.
void CancellationSource::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        for (auto& [id, callback] : state_->callbacks) {
            callbacks.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }
    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace CKW
