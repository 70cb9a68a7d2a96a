#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "sandbox/event_channel.hpp"
#include "sandbox/execution_sandbox.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using sandrun::core::errors::FailureKind;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::policy::GpuPolicy;
using sandrun::protocol::RawEvent;
using sandrun::sandbox::EventChannel;
using sandrun::sandbox::ExecutionSandbox;
using sandrun::sandbox::SandboxRequest;
using sandrun::testing::TempWorkspace;
using sandrun::testing::units_artifact;

const char* kWriteMetrics = R"(printf '{"accuracy": 0.5}\n' > metrics.json)";
const char* kSeededMetrics =
    R"(awk -v s="$SANDRUN_SEED" 'BEGIN { srand(s); printf "{\"score\": %.6f}\n", rand() }' > metrics.json)";

ExecutionSandbox make_sandbox() {
    GpuPolicy policy;
    policy.check_host_environment = false;
    return ExecutionSandbox(policy);
}

SandboxRequest make_request(const TempWorkspace& workspace, std::string artifact,
                            std::int64_t seed = 42) {
    SandboxRequest request;
    request.run_id = "run-test";
    request.artifact_bytes = std::move(artifact);
    request.seed = seed;
    request.unit_timeout_ms = 10000;
    request.work_root = workspace.root() / "work";
    request.cancel_token = std::make_shared<std::atomic_bool>(false);
    return request;
}

std::vector<std::string> kinds_of(const std::vector<RawEvent>& events) {
    std::vector<std::string> out;
    for (const auto& event : events) {
        out.push_back(event.kind);
    }
    return out;
}

std::vector<std::string> log_messages(const std::vector<RawEvent>& events) {
    std::vector<std::string> out;
    for (const auto& event : events) {
        if (event.kind == "log_line") {
            out.push_back(event.payload.at("message").get<std::string>());
        }
    }
    return out;
}

TEST(ExecutionSandboxTest, RunsUnitsInOrderAndCollectsArtifacts) {
    TempWorkspace workspace("sandbox");
    const auto artifact = units_artifact(
        {"echo first",
         R"(echo '{"type":"metric_update","metric":"acc","value":0.9,"split":"val"}' >> events.jsonl)",
         std::string("echo third; ") + kWriteMetrics});
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, artifact), channel);
    ASSERT_FALSE(is_error(result));

    const auto& artifacts = get_value(result);
    EXPECT_EQ(artifacts.metrics, "{\"accuracy\": 0.5}\n");
    EXPECT_NE(artifacts.logs.find("first\n"), std::string::npos);
    EXPECT_NE(artifacts.logs.find("third\n"), std::string::npos);
    EXPECT_NE(artifacts.events.find("\"metric_update\""), std::string::npos);

    const auto events = channel.drain();
    const auto messages = log_messages(events);
    ASSERT_GE(messages.size(), 4u);
    EXPECT_EQ(messages[0], "Environment: /bin/sh units, CPU-only mode");
    EXPECT_EQ(messages[1], "seed set: 42");

    std::vector<int> progress;
    for (const auto& event : events) {
        if (event.kind == "progress") {
            progress.push_back(event.payload.at("percent").get<int>());
        }
        if (event.kind == "metric_update") {
            EXPECT_EQ(event.payload.at("metric"), "acc");
            EXPECT_FALSE(event.payload.contains("type"));
        }
    }
    EXPECT_EQ(progress, (std::vector<int>{33, 66, 100}));
    EXPECT_TRUE(std::filesystem::is_empty(workspace.root() / "work"));
}

TEST(ExecutionSandboxTest, SameSeedGivesIdenticalMetrics) {
    TempWorkspace workspace("sandbox");
    const auto artifact = units_artifact({kSeededMetrics});

    EventChannel first_channel;
    EventChannel second_channel;
    EventChannel other_channel;
    auto first = make_sandbox().execute(make_request(workspace, artifact, 7), first_channel);
    auto second = make_sandbox().execute(make_request(workspace, artifact, 7), second_channel);
    auto other = make_sandbox().execute(make_request(workspace, artifact, 8), other_channel);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    ASSERT_FALSE(is_error(other));

    EXPECT_EQ(get_value(first).metrics, get_value(second).metrics);
    EXPECT_NE(get_value(first).metrics, get_value(other).metrics);
}

TEST(ExecutionSandboxTest, UnitsSeeSeedAndHiddenDevices) {
    TempWorkspace workspace("sandbox");
    const auto artifact = units_artifact(
        {std::string(R"(echo "seed=$SANDRUN_SEED hash=$PYTHONHASHSEED cuda=$CUDA_VISIBLE_DEVICES tz=$TZ"; )") +
         kWriteMetrics});
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, artifact, 1234), channel);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).logs.find("seed=1234 hash=1234 cuda=-1 tz=UTC"),
              std::string::npos);
}

TEST(ExecutionSandboxTest, GpuRequestFailsBeforeAnyUnitRuns) {
    TempWorkspace workspace("sandbox");
    const auto marker = workspace.root() / "ran.txt";
    const auto artifact = units_artifact({"touch '" + marker.string() + "'"},
                                         json::object(), true);
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, artifact), channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "gpu_requested");
    EXPECT_EQ(get_error(result).failure, FailureKind::GpuRequested);
    EXPECT_FALSE(std::filesystem::exists(marker));
    EXPECT_TRUE(channel.drain().empty());
}

TEST(ExecutionSandboxTest, DeviceVariableInArtifactEnvIsAGpuRequest) {
    TempWorkspace workspace("sandbox");
    const auto artifact = units_artifact({kWriteMetrics}, {{"CUDA_VISIBLE_DEVICES", "0,1"}});
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, artifact), channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).failure, FailureKind::GpuRequested);
}

TEST(ExecutionSandboxTest, FailingUnitStopsExecution) {
    TempWorkspace workspace("sandbox");
    const auto marker = workspace.root() / "third.txt";
    const auto artifact = units_artifact(
        {"echo one", "echo 'division by zero' >&2; exit 1", "touch '" + marker.string() + "'"});
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, artifact), channel);
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.code, "unit_failed");
    EXPECT_EQ(err.failure, FailureKind::ExecutionError);
    EXPECT_EQ(err.message, "Unit unit-2 failed: division by zero");
    EXPECT_FALSE(std::filesystem::exists(marker));

    const auto kinds = kinds_of(channel.drain());
    EXPECT_EQ(std::count(kinds.begin(), kinds.end(), "progress"), 1);
}

TEST(ExecutionSandboxTest, MissingMetricsIsAnExecutionError) {
    TempWorkspace workspace("sandbox");
    EventChannel channel;

    auto result = make_sandbox().execute(
        make_request(workspace, units_artifact({"echo no metrics"})), channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "metrics_missing");
    EXPECT_EQ(get_error(result).failure, FailureKind::ExecutionError);
}

TEST(ExecutionSandboxTest, MalformedArtifactIsAnExecutionError) {
    TempWorkspace workspace("sandbox");
    EventChannel channel;

    auto result = make_sandbox().execute(make_request(workspace, "{\"units\": 3}"), channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_artifact");
}

TEST(ExecutionSandboxTest, CancelledTokenStopsBeforeNextUnit) {
    TempWorkspace workspace("sandbox");
    EventChannel channel;
    auto request = make_request(workspace, units_artifact({"echo never", kWriteMetrics}));
    request.cancel_token->store(true);

    auto result = make_sandbox().execute(request, channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "sandbox_cancelled");
    EXPECT_EQ(get_error(result).failure, FailureKind::RunTimeout);
}

TEST(ExecutionSandboxTest, UnitTimeoutIsARunTimeout) {
    TempWorkspace workspace("sandbox");
    EventChannel channel;
    auto request = make_request(workspace, units_artifact({"sleep 5"}));
    request.unit_timeout_ms = 150;

    auto result = make_sandbox().execute(request, channel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unit_timed_out");
    EXPECT_EQ(get_error(result).failure, FailureKind::RunTimeout);
}

TEST(ExecutionSandboxTest, AppendsUnitLogFileToLogs) {
    TempWorkspace workspace("sandbox");
    EventChannel channel;
    const auto artifact = units_artifact(
        {std::string("echo 'epoch 1 done' > logs.txt; ") + kWriteMetrics});

    auto result = make_sandbox().execute(make_request(workspace, artifact), channel);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).logs.find("epoch 1 done\n"), std::string::npos);
}

}  // namespace
