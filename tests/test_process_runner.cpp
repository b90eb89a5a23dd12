// EN: Unit tests for PosixCommandRunner.
// FR: Tests unitaires du PosixCommandRunner.

#include <gtest/gtest.h>
#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace SSD;
using namespace std::chrono_literals;

namespace {

CommandSpec shell(const std::string& script) {
    return CommandSpec{{"/bin/sh", "-c", script}};
}

} // namespace

// EN: Test fixture with a small pool and a scratch working directory
// FR: Fixture de test avec un petit pool et un répertoire de travail temporaire
class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleStream(&log_sink_);
        work_dir_ = std::filesystem::temp_directory_path() /
                    ("ssd_process_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(work_dir_);

        ThreadPoolConfig config;
        config.threads = 2;
        pool_ = std::make_unique<ThreadPool>(config);
        runner_ = std::make_unique<PosixCommandRunner>(*pool_);
    }

    void TearDown() override {
        runner_.reset();
        pool_.reset();
        std::filesystem::remove_all(work_dir_);
        Logger::getInstance().setConsoleStream(nullptr);
    }

    std::ostringstream log_sink_;
    std::filesystem::path work_dir_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<PosixCommandRunner> runner_;
};

TEST_F(ProcessRunnerTest, DisplayJoinsArguments) {
    EXPECT_EQ((CommandSpec{{"npm", "run", "build"}}).display(), "npm run build");
    EXPECT_EQ(CommandSpec{}.display(), "");
}

TEST_F(ProcessRunnerTest, CapturesOutputAndExitCode) {
    const CommandResult result = runner_->execute(shell("echo out; echo err >&2; exit 3"), work_dir_, {});

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.standard_output, "out\n");
    EXPECT_EQ(result.standard_error, "err\n");
}

TEST_F(ProcessRunnerTest, RunsInWorkingDirectory) {
    {
        std::ofstream marker(work_dir_ / "package.json");
        marker << "{}";
    }

    const CommandResult result = runner_->execute(shell("test -f package.json && pwd"), work_dir_, {});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(std::filesystem::path(result.standard_output.substr(0, result.standard_output.size() - 1)),
              std::filesystem::canonical(work_dir_));
}

TEST_F(ProcessRunnerTest, StdinIsEmpty) {
    const CommandResult result = runner_->execute(shell("cat; echo done"), work_dir_, {});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.standard_output, "done\n");
}

// EN: A missing program reports 127 and a readable reason on stderr
// FR: Un programme introuvable rapporte 127 et une raison lisible sur stderr
TEST_F(ProcessRunnerTest, MissingProgramExits127) {
    const CommandResult result = runner_->execute(CommandSpec{{"ssd-definitely-not-a-program"}}, work_dir_, {});

    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.standard_error.find("could not execute ssd-definitely-not-a-program"), std::string::npos);
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryExits127) {
    const CommandResult result = runner_->execute(shell("true"), work_dir_ / "missing", {});

    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.standard_error.find("cannot change to working directory"), std::string::npos);
}

TEST_F(ProcessRunnerTest, SignalledChildReports128PlusSignal) {
    const CommandResult result = runner_->execute(shell("kill -TERM $$"), work_dir_, {});
    EXPECT_EQ(result.exit_code, 128 + SIGTERM);
}

TEST_F(ProcessRunnerTest, EmptyCommandIsRejected) {
    EXPECT_THROW(runner_->execute(CommandSpec{}, work_dir_, {}), std::invalid_argument);
}

TEST_F(ProcessRunnerTest, RunReturnsFutureFromPool) {
    auto future = runner_->run(shell("printf '%s' \"$0\"; exit 0"), work_dir_, {});
    const CommandResult result = future.get();
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.standard_output, "/bin/sh");
}

TEST_F(ProcessRunnerTest, LargeOutputDoesNotDeadlock) {
    const CommandResult result = runner_->execute(
        shell("i=0; while [ $i -lt 2000 ]; do echo 0123456789012345678901234567890123456789; "
              "echo 0123456789012345678901234567890123456789 >&2; i=$((i+1)); done"),
        work_dir_, {});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.standard_output.size(), 2000u * 41u);
    EXPECT_EQ(result.standard_error.size(), 2000u * 41u);
}

TEST_F(ProcessRunnerTest, AlreadyCancelledTokenDoesNotSpawn) {
    CancellationSource source;
    source.cancel();
    EXPECT_THROW(runner_->execute(shell("touch spawned"), work_dir_, source.token()), OperationCancelledError);
    EXPECT_FALSE(std::filesystem::exists(work_dir_ / "spawned"));
}

// EN: Cancellation terminates a long-running child promptly
// FR: L'annulation termine rapidement un enfant de longue durée
TEST_F(ProcessRunnerTest, CancellationTerminatesChild) {
    CancellationSource source;
    auto future = runner_->run(shell("sleep 30"), work_dir_, source.token());

    std::this_thread::sleep_for(200ms);
    const auto start = std::chrono::steady_clock::now();
    source.cancel("user abort");

    EXPECT_THROW(future.get(), OperationCancelledError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}
