// EN: Unit tests for SignalHandler.
// FR: Tests unitaires du SignalHandler.

#include <gtest/gtest.h>
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/threading/cancellation.hpp"
#include "infrastructure/logging/logger.hpp"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <future>
#include <sstream>

using namespace SSD;
using namespace std::chrono_literals;

// EN: Test fixture resetting the singleton before and after each test
// FR: Fixture de test remettant le singleton à zéro avant et après chaque test
class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleStream(&log_sink_);
        signal_handler_ = &SignalHandler::getInstance();
        signal_handler_->reset();
    }

    void TearDown() override {
        signal_handler_->reset();
        Logger::getInstance().setConsoleStream(nullptr);
    }

    std::ostringstream log_sink_;
    SignalHandler* signal_handler_{nullptr};
};

TEST_F(SignalHandlerTest, SingletonPattern) {
    EXPECT_EQ(&SignalHandler::getInstance(), signal_handler_);
}

TEST_F(SignalHandlerTest, InitiallyNoShutdownRequested) {
    EXPECT_FALSE(signal_handler_->isShutdownRequested());
    EXPECT_EQ(signal_handler_->lastSignal(), 0);
}

TEST_F(SignalHandlerTest, TriggerShutdownRunsCallbacksSynchronously) {
    std::atomic<int> received{0};
    signal_handler_->registerShutdownCallback("first", [&received](int signal_number) {
        received += signal_number;
    });
    signal_handler_->registerShutdownCallback("second", [&received](int signal_number) {
        received += signal_number;
    });

    signal_handler_->triggerShutdown(SIGINT);

    EXPECT_EQ(received.load(), 2 * SIGINT);
    EXPECT_TRUE(signal_handler_->isShutdownRequested());
    EXPECT_EQ(signal_handler_->lastSignal(), SIGINT);
}

// EN: Callbacks run once even if shutdown is triggered repeatedly
// FR: Les callbacks ne s'exécutent qu'une fois même si l'arrêt est déclenché plusieurs fois
TEST_F(SignalHandlerTest, CallbacksRunOnlyOnce) {
    std::atomic<int> calls{0};
    signal_handler_->registerShutdownCallback("counter", [&calls](int) { calls++; });

    signal_handler_->triggerShutdown(SIGTERM);
    signal_handler_->triggerShutdown(SIGTERM);

    EXPECT_EQ(calls.load(), 1);
}

TEST_F(SignalHandlerTest, UnregisteredCallbackIsNotCalled) {
    std::atomic<bool> called{false};
    signal_handler_->registerShutdownCallback("gone", [&called](int) { called = true; });
    signal_handler_->unregisterShutdownCallback("gone");

    signal_handler_->triggerShutdown(SIGTERM);

    EXPECT_FALSE(called.load());
}

// EN: A real SIGTERM is turned into a callback on the watcher thread
// FR: Un vrai SIGTERM est transformé en callback sur le thread de surveillance
TEST_F(SignalHandlerTest, RealSignalCancelsSource) {
    CancellationSource source;
    std::promise<int> delivered;
    auto delivered_future = delivered.get_future();

    signal_handler_->initialize();
    signal_handler_->initialize();
    signal_handler_->registerShutdownCallback("cancel", [&source, &delivered](int signal_number) {
        source.cancel("Received signal " + std::to_string(signal_number));
        delivered.set_value(signal_number);
    });

    ASSERT_EQ(raise(SIGTERM), 0);

    ASSERT_EQ(delivered_future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(delivered_future.get(), SIGTERM);
    EXPECT_TRUE(source.isCancellationRequested());
    EXPECT_EQ(source.token().reason(), "Received signal " + std::to_string(SIGTERM));
}

TEST_F(SignalHandlerTest, ResetClearsState) {
    signal_handler_->registerShutdownCallback("any", [](int) {});
    signal_handler_->triggerShutdown(SIGINT);
    signal_handler_->reset();

    EXPECT_FALSE(signal_handler_->isShutdownRequested());

    std::atomic<int> calls{0};
    signal_handler_->registerShutdownCallback("again", [&calls](int) { calls++; });
    signal_handler_->triggerShutdown(SIGINT);
    EXPECT_EQ(calls.load(), 1);
}
