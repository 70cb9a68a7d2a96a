#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <gtest/gtest.h>
#include "sandbox/process_runner.hpp"
#include "test_support.hpp"

namespace {

using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::sandbox::ProcessRequest;
using sandrun::sandbox::run_process;
using sandrun::testing::TempWorkspace;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request;
    request.script = "echo out; echo err >&2; exit 3";
    request.working_directory = workspace.root();

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
    EXPECT_FALSE(capture.timed_out);
}

TEST(ProcessRunnerTest, AppliesEnvironmentOverridesAndWorkingDirectory) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request;
    request.script = "printf '%s' \"$SANDRUN_SEED\" > seed.txt";
    request.working_directory = workspace.root();
    request.env_overrides = {{"SANDRUN_SEED", "1234"}};

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(sandrun::testing::read_file(workspace.root() / "seed.txt"), "1234");
}

TEST(ProcessRunnerTest, TimesOutAndKillsProcessGroup) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request;
    request.script = "sleep 5 & sleep 5";
    request.working_directory = workspace.root();
    request.timeout_ms = 200;

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessRunnerTest, HonorsCancellationToken) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request;
    request.script = "sleep 5";
    request.working_directory = workspace.root();
    request.cancel_token = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([token = request.cancel_token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->store(true);
    });
    auto result = run_process(request);
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
}

TEST(ProcessRunnerTest, CancelledBeforeStartDoesNotRun) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request;
    request.script = "touch ran.txt";
    request.working_directory = workspace.root();
    request.cancel_token = std::make_shared<std::atomic_bool>(true);

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "ran.txt"));
}

}  // namespace
