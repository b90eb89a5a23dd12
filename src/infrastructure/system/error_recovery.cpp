// EN: Implementation of the error recovery system.
// FR: Implémentation du système de récupération d'erreurs.

#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/networking/http_client.hpp"

#include <algorithm>
#include <cmath>

namespace SSD {

RetryContext::RetryContext(std::string operation_name, const RetryConfig& config)
    : operation_name_(std::move(operation_name)), config_(config),
      jitter_generator_(std::random_device{}()) {}

void RetryContext::recordFailure(RecoverableErrorType, const std::string& error_message) {
    last_error_ = error_message;
    ++current_attempt_;
}

bool RetryContext::canRetry() const {
    return current_attempt_ < config_.max_attempts;
}

std::chrono::milliseconds RetryContext::getNextDelay() const {
    const size_t failures = current_attempt_ > 1 ? current_attempt_ - 1 : 1;
    double delay = static_cast<double>(config_.initial_delay.count()) *
                   std::pow(config_.backoff_multiplier, static_cast<double>(failures - 1));
    delay = std::min(delay, static_cast<double>(config_.max_delay.count()));

    if (config_.enable_jitter && config_.jitter_factor > 0.0) {
        std::uniform_real_distribution<double> distribution(-config_.jitter_factor, config_.jitter_factor);
        delay += delay * distribution(jitter_generator_);
    }
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay)));
}

ErrorRecoveryManager& ErrorRecoveryManager::getInstance() {
    static ErrorRecoveryManager instance;
    return instance;
}

RecoverableErrorType ErrorRecoveryManager::classifyError(const std::exception& error) const {
    if (const auto* status_error = dynamic_cast<const Http::HttpStatusError*>(&error)) {
        return ErrorRecoveryUtils::classifyHttpStatus(status_error->status());
    }
    if (dynamic_cast<const Http::HttpTransportError*>(&error)) {
        return RecoverableErrorType::TRANSPORT_FAILURE;
    }
    return RecoverableErrorType::NON_RECOVERABLE;
}

bool ErrorRecoveryManager::isRecoverable(const std::exception& error) const {
    return classifyError(error) != RecoverableErrorType::NON_RECOVERABLE;
}

RetryStatistics ErrorRecoveryManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

void ErrorRecoveryManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    statistics_ = RetryStatistics{};
}

void ErrorRecoveryManager::recordOutcome(const RetryContext& context, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    statistics_.total_operations++;
    statistics_.total_retries += context.getCurrentAttempt() - 1;
    if (success) {
        statistics_.successful_operations++;
    } else {
        statistics_.failed_operations++;
    }
}

namespace ErrorRecoveryUtils {

RecoverableErrorType classifyHttpStatus(long status_code) {
    if (status_code == 429) {
        return RecoverableErrorType::HTTP_429;
    }
    if (status_code >= 500 && status_code <= 599) {
        return RecoverableErrorType::HTTP_5XX;
    }
    return RecoverableErrorType::NON_RECOVERABLE;
}

std::string errorTypeToString(RecoverableErrorType type) {
    switch (type) {
        case RecoverableErrorType::TRANSPORT_FAILURE: return "TRANSPORT_FAILURE";
        case RecoverableErrorType::HTTP_5XX:          return "HTTP_5XX";
        case RecoverableErrorType::HTTP_429:          return "HTTP_429";
        case RecoverableErrorType::NON_RECOVERABLE:   return "NON_RECOVERABLE";
    }
    return "UNKNOWN";
}

} // namespace ErrorRecoveryUtils

} // namespace SSD
