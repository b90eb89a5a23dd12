// EN: Implementation of the cancellation source and token.
// FR: Implémentation de la source et du token d'annulation.

#include "infrastructure/threading/cancellation.hpp"

#include <thread>

namespace SSD {

bool CancellationToken::isCancellationRequested() const {
    return state_ && state_->cancelled.load();
}

std::string CancellationToken::reason() const {
    if (!state_) {
        return {};
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

void CancellationToken::throwIfCancellationRequested() const {
    if (isCancellationRequested()) {
        const std::string why = reason();
        throw OperationCancelledError(why.empty() ? "Operation was cancelled" : why);
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds delay) const {
    if (!state_) {
        std::this_thread::sleep_for(delay);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->condition.wait_for(lock, delay, [this] { return state_->cancelled.load(); });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load()) {
            return;
        }
        state_->reason = reason;
        state_->cancelled.store(true);
    }
    state_->condition.notify_all();
}

bool CancellationSource::isCancellationRequested() const {
    return state_->cancelled.load();
}

} // namespace SSD
