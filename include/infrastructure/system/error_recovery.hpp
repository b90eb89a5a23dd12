// EN: Error recovery for ssdctl. Auto-retry with exponential backoff on transient remote failures.
// FR: Récupération d'erreurs pour ssdctl. Retry automatique avec backoff exponentiel sur les échecs distants transitoires.

#pragma once

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/cancellation.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

namespace SSD {

// EN: Classification of a failure for retry purposes.
// FR: Classification d'un échec pour le retry.
enum class RecoverableErrorType {
    TRANSPORT_FAILURE,  // EN: No HTTP response (DNS, connect, TLS, timeout) / FR: Pas de réponse HTTP
    HTTP_5XX,           // EN: HTTP 5xx server errors / FR: Erreurs serveur HTTP 5xx
    HTTP_429,           // EN: HTTP 429 throttling / FR: HTTP 429 limitation de débit
    NON_RECOVERABLE
};

// EN: Retry strategy configuration.
// FR: Configuration de la stratégie de retry.
struct RetryConfig {
    size_t max_attempts{4};                          // EN: Total attempts, first one included / FR: Tentatives totales, première incluse
    std::chrono::milliseconds initial_delay{200};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier{2.0};
    double jitter_factor{0.1};                       // EN: +/- fraction of the delay / FR: +/- fraction du délai
    bool enable_jitter{true};
};

struct RetryStatistics {
    size_t total_operations{0};
    size_t successful_operations{0};
    size_t failed_operations{0};
    size_t total_retries{0};
};

// EN: Per-operation retry bookkeeping.
// FR: Suivi des retries pour une opération.
class RetryContext {
public:
    explicit RetryContext(std::string operation_name, const RetryConfig& config = {});

    void recordFailure(RecoverableErrorType error_type, const std::string& error_message);
    size_t getCurrentAttempt() const { return current_attempt_; }
    bool canRetry() const;

    // EN: Delay before the next attempt: initial * multiplier^(failures-1), capped, then jittered.
    // FR: Délai avant la prochaine tentative : initial * multiplicateur^(échecs-1), plafonné, puis jitter.
    std::chrono::milliseconds getNextDelay() const;

    const std::string& getOperationName() const { return operation_name_; }
    const std::string& getLastError() const { return last_error_; }

private:
    std::string operation_name_;
    RetryConfig config_;
    size_t current_attempt_{1};
    std::string last_error_;
    mutable std::mt19937 jitter_generator_;
};

// EN: Retry driver. Only transient remote failures are retried; cancellation never is.
//     On exhaustion the last error is rethrown unchanged.
// FR: Moteur de retry. Seuls les échecs distants transitoires sont retentés ; l'annulation jamais.
//     À l'épuisement, la dernière erreur est relancée telle quelle.
class ErrorRecoveryManager {
public:
    static ErrorRecoveryManager& getInstance();

    template<typename Func>
    auto executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                          const CancellationToken& token, Func&& func)
        -> std::invoke_result_t<Func>;

    RecoverableErrorType classifyError(const std::exception& error) const;
    bool isRecoverable(const std::exception& error) const;

    RetryStatistics getStatistics() const;
    void resetStatistics();

private:
    ErrorRecoveryManager() = default;
    ErrorRecoveryManager(const ErrorRecoveryManager&) = delete;
    ErrorRecoveryManager& operator=(const ErrorRecoveryManager&) = delete;

    void recordOutcome(const RetryContext& context, bool success);

    mutable std::mutex mutex_;
    RetryStatistics statistics_;
};

namespace ErrorRecoveryUtils {
    RecoverableErrorType classifyHttpStatus(long status_code);
    std::string errorTypeToString(RecoverableErrorType type);
} // namespace ErrorRecoveryUtils

template<typename Func>
auto ErrorRecoveryManager::executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                                            const CancellationToken& token, Func&& func)
    -> std::invoke_result_t<Func> {
    RetryContext context(operation_name, config);

    while (true) {
        token.throwIfCancellationRequested();
        std::chrono::milliseconds delay{0};
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
                func();
                recordOutcome(context, true);
                return;
            } else {
                auto result = func();
                recordOutcome(context, true);
                return result;
            }
        } catch (const OperationCancelledError&) {
            throw;
        } catch (const std::exception& e) {
            const RecoverableErrorType type = classifyError(e);
            if (type == RecoverableErrorType::NON_RECOVERABLE || !context.canRetry()) {
                recordOutcome(context, false);
                throw;
            }
            context.recordFailure(type, e.what());
            delay = context.getNextDelay();
            SSD_LOG_WARN_META("error_recovery", "Retrying " + operation_name + " after: " + e.what(),
                              (std::unordered_map<std::string, std::string>{
                                  {"attempt", std::to_string(context.getCurrentAttempt())},
                                  {"delay_ms", std::to_string(delay.count())},
                                  {"error_type", ErrorRecoveryUtils::errorTypeToString(type)}}));
        }

        if (token.waitFor(delay)) {
            throw OperationCancelledError("Retry of " + operation_name + " cancelled");
        }
    }
}

} // namespace SSD
