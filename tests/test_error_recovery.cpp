// EN: Unit tests for the error recovery system: classification, backoff and retry loop.
// FR: Tests unitaires du système de récupération d'erreurs : classification, backoff et boucle de retry.

#include <gtest/gtest.h>
#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/networking/http_client.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace SSD;
using namespace std::chrono_literals;

// EN: Test fixture for Error Recovery tests
// FR: Fixture de test pour les tests Error Recovery
class ErrorRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleStream(&log_sink_);
        error_recovery_ = &ErrorRecoveryManager::getInstance();
        error_recovery_->resetStatistics();

        // EN: Short delays and no jitter for predictable tests
        // FR: Délais courts et pas de jitter pour des tests prédictibles
        config_.max_attempts = 3;
        config_.initial_delay = 10ms;
        config_.max_delay = 1000ms;
        config_.backoff_multiplier = 2.0;
        config_.enable_jitter = false;
    }

    void TearDown() override {
        error_recovery_->resetStatistics();
        Logger::getInstance().setConsoleStream(nullptr);
    }

    std::ostringstream log_sink_;
    ErrorRecoveryManager* error_recovery_{nullptr};
    RetryConfig config_;
};

TEST_F(ErrorRecoveryTest, SingletonPattern) {
    EXPECT_EQ(&ErrorRecoveryManager::getInstance(), error_recovery_);
}

TEST_F(ErrorRecoveryTest, ClassifiesHttpStatuses) {
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(429), RecoverableErrorType::HTTP_429);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(500), RecoverableErrorType::HTTP_5XX);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(503), RecoverableErrorType::HTTP_5XX);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(404), RecoverableErrorType::NON_RECOVERABLE);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(403), RecoverableErrorType::NON_RECOVERABLE);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpStatus(200), RecoverableErrorType::NON_RECOVERABLE);
}

TEST_F(ErrorRecoveryTest, ClassifiesExceptions) {
    EXPECT_EQ(error_recovery_->classifyError(Http::HttpStatusError(503, "busy")), RecoverableErrorType::HTTP_5XX);
    EXPECT_EQ(error_recovery_->classifyError(Http::HttpStatusError(429, "")), RecoverableErrorType::HTTP_429);
    EXPECT_EQ(error_recovery_->classifyError(Http::HttpTransportError(7, "connect failed")),
              RecoverableErrorType::TRANSPORT_FAILURE);
    EXPECT_EQ(error_recovery_->classifyError(Http::HttpStatusError(403, "denied")),
              RecoverableErrorType::NON_RECOVERABLE);
    EXPECT_EQ(error_recovery_->classifyError(std::runtime_error("other")), RecoverableErrorType::NON_RECOVERABLE);

    EXPECT_TRUE(error_recovery_->isRecoverable(Http::HttpTransportError(28, "timeout")));
    EXPECT_FALSE(error_recovery_->isRecoverable(std::logic_error("bug")));
}

TEST_F(ErrorRecoveryTest, ErrorTypeToString) {
    EXPECT_EQ(ErrorRecoveryUtils::errorTypeToString(RecoverableErrorType::TRANSPORT_FAILURE), "TRANSPORT_FAILURE");
    EXPECT_EQ(ErrorRecoveryUtils::errorTypeToString(RecoverableErrorType::HTTP_5XX), "HTTP_5XX");
    EXPECT_EQ(ErrorRecoveryUtils::errorTypeToString(RecoverableErrorType::HTTP_429), "HTTP_429");
    EXPECT_EQ(ErrorRecoveryUtils::errorTypeToString(RecoverableErrorType::NON_RECOVERABLE), "NON_RECOVERABLE");
}

// EN: Exponential backoff capped by max_delay
// FR: Backoff exponentiel plafonné par max_delay
TEST_F(ErrorRecoveryTest, BackoffGrowsAndIsCapped) {
    config_.max_attempts = 10;
    config_.initial_delay = 100ms;
    config_.max_delay = 350ms;
    RetryContext context("op", config_);

    EXPECT_EQ(context.getCurrentAttempt(), 1u);
    context.recordFailure(RecoverableErrorType::HTTP_5XX, "e1");
    EXPECT_EQ(context.getNextDelay(), 100ms);
    context.recordFailure(RecoverableErrorType::HTTP_5XX, "e2");
    EXPECT_EQ(context.getNextDelay(), 200ms);
    context.recordFailure(RecoverableErrorType::HTTP_5XX, "e3");
    EXPECT_EQ(context.getNextDelay(), 350ms);
    EXPECT_EQ(context.getLastError(), "e3");
    EXPECT_EQ(context.getOperationName(), "op");
}

TEST_F(ErrorRecoveryTest, JitterStaysWithinBounds) {
    config_.initial_delay = 1000ms;
    config_.enable_jitter = true;
    config_.jitter_factor = 0.1;
    RetryContext context("op", config_);
    context.recordFailure(RecoverableErrorType::HTTP_429, "throttled");

    for (int i = 0; i < 50; ++i) {
        const auto delay = context.getNextDelay();
        EXPECT_GE(delay, 900ms);
        EXPECT_LE(delay, 1100ms);
    }
}

TEST_F(ErrorRecoveryTest, CanRetryUntilMaxAttempts) {
    RetryContext context("op", config_);
    EXPECT_TRUE(context.canRetry());
    context.recordFailure(RecoverableErrorType::HTTP_5XX, "1");
    EXPECT_TRUE(context.canRetry());
    context.recordFailure(RecoverableErrorType::HTTP_5XX, "2");
    EXPECT_FALSE(context.canRetry());
}

TEST_F(ErrorRecoveryTest, SuccessOnFirstAttempt) {
    std::atomic<int> calls{0};
    const int result = error_recovery_->executeWithRetry("op", config_, CancellationToken(), [&calls]() {
        calls++;
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls.load(), 1);
    const auto stats = error_recovery_->getStatistics();
    EXPECT_EQ(stats.total_operations, 1u);
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.total_retries, 0u);
}

// EN: Transient failures are retried until the call succeeds
// FR: Les échecs transitoires sont retentés jusqu'au succès de l'appel
TEST_F(ErrorRecoveryTest, RetriesTransientFailures) {
    std::atomic<int> calls{0};
    error_recovery_->executeWithRetry("upload", config_, CancellationToken(), [&calls]() {
        if (++calls < 3) {
            throw Http::HttpStatusError(503, "Server Busy", "ServerBusy");
        }
    });

    EXPECT_EQ(calls.load(), 3);
    const auto stats = error_recovery_->getStatistics();
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.total_retries, 2u);
}

TEST_F(ErrorRecoveryTest, ExhaustionRethrowsLastError) {
    std::atomic<int> calls{0};
    try {
        error_recovery_->executeWithRetry("upload", config_, CancellationToken(), [&calls]() {
            calls++;
            throw Http::HttpStatusError(500, "attempt " + std::to_string(calls.load()));
        });
        FAIL() << "Expected HttpStatusError";
    } catch (const Http::HttpStatusError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.body(), "attempt 3");
    }

    EXPECT_EQ(calls.load(), 3);
    const auto stats = error_recovery_->getStatistics();
    EXPECT_EQ(stats.failed_operations, 1u);
    EXPECT_EQ(stats.total_retries, 2u);
}

TEST_F(ErrorRecoveryTest, NonRecoverableErrorsAreNotRetried) {
    std::atomic<int> calls{0};
    EXPECT_THROW(error_recovery_->executeWithRetry("op", config_, CancellationToken(), [&calls]() {
        calls++;
        throw Http::HttpStatusError(403, "AuthorizationFailure");
    }), Http::HttpStatusError);
    EXPECT_EQ(calls.load(), 1);

    EXPECT_THROW(error_recovery_->executeWithRetry("op", config_, CancellationToken(), []() {
        throw std::invalid_argument("bad input");
    }), std::invalid_argument);
}

TEST_F(ErrorRecoveryTest, CancellationIsNeverRetried) {
    std::atomic<int> calls{0};
    EXPECT_THROW(error_recovery_->executeWithRetry("op", config_, CancellationToken(), [&calls]() {
        calls++;
        throw OperationCancelledError();
    }), OperationCancelledError);
    EXPECT_EQ(calls.load(), 1);
}

// EN: Cancelling during the backoff wait aborts the retry loop
// FR: Annuler pendant l'attente du backoff interrompt la boucle de retry
TEST_F(ErrorRecoveryTest, CancellationDuringBackoff) {
    config_.max_attempts = 5;
    config_.initial_delay = 10s;
    config_.max_delay = 10s;
    CancellationSource source;

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(50ms);
        source.cancel("stop");
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(error_recovery_->executeWithRetry("op", config_, source.token(), []() {
        throw Http::HttpTransportError(7, "connection refused");
    }), OperationCancelledError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
}

TEST_F(ErrorRecoveryTest, AlreadyCancelledTokenSkipsTheCall) {
    CancellationSource source;
    source.cancel();
    bool called = false;
    EXPECT_THROW(error_recovery_->executeWithRetry("op", config_, source.token(), [&called]() { called = true; }),
                 OperationCancelledError);
    EXPECT_FALSE(called);
}
