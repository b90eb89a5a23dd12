#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace SSD {

// EN: Thrown when an operation observes a cancellation request.
// FR: Levée quand une opération observe une demande d'annulation.
class OperationCancelledError : public std::runtime_error {
public:
    explicit OperationCancelledError(const std::string& message = "Operation was cancelled")
        : std::runtime_error(message) {}
};

namespace detail {
    struct CancellationState {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable condition;
        std::string reason;
    };
}

// EN: Read-only view of a cancellation signal. A default-constructed token is never cancelled.
// FR: Vue en lecture seule d'un signal d'annulation. Un token construit par défaut n'est jamais annulé.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const;
    std::string reason() const;

    // EN: Throws OperationCancelledError if cancellation was requested.
    // FR: Lève OperationCancelledError si l'annulation a été demandée.
    void throwIfCancellationRequested() const;

    // EN: Interruptible sleep. Returns true if cancelled before the delay elapsed.
    // FR: Attente interruptible. Retourne true si annulé avant la fin du délai.
    bool waitFor(std::chrono::milliseconds delay) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// EN: Owner of a cancellation signal; hands out tokens and triggers them once.
// FR: Propriétaire d'un signal d'annulation ; distribue les tokens et les déclenche une fois.
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }

    // EN: Request cancellation. Only the first reason is kept.
    // FR: Demande l'annulation. Seule la première raison est conservée.
    void cancel(const std::string& reason = "Operation was cancelled");
    bool isCancellationRequested() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// EN: Wait for a future while observing the token; throws OperationCancelledError on cancellation.
// FR: Attend un future en observant le token ; lève OperationCancelledError en cas d'annulation.
template<typename T>
T awaitResult(std::future<T>& future, const CancellationToken& token,
              std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20)) {
    if (!future.valid()) {
        throw std::logic_error("awaitResult called on an invalid future");
    }
    while (true) {
        token.throwIfCancellationRequested();
        if (future.wait_for(poll_interval) == std::future_status::ready) {
            return future.get();
        }
    }
}

} // namespace SSD
