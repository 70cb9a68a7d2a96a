#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bus/event_bus.hpp"
#include "core/config/run_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/run_errors.hpp"
#include "protocol/run_contract.hpp"
#include "session/run_service.hpp"
#include "storage/file_blob_store.hpp"
#include "storage/file_plan_store.hpp"
#include "storage/file_run_store.hpp"
#include "test_support.hpp"

namespace {

using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::protocol::RunStatus;
using sandrun::session::OrchestratorDeps;
using sandrun::session::RunService;
using sandrun::testing::TempWorkspace;
using sandrun::testing::units_artifact;

const char* kSeededMetrics =
    R"(awk -v s="$SANDRUN_SEED" 'BEGIN { srand(s); printf "{\"score\": %.6f}\n", rand() }' > metrics.json)";

class ServiceFixture : public ::testing::Test {
protected:
    ServiceFixture()
        : workspace_("run_service"),
          plans_(workspace_.root()),
          runs_(workspace_.root() / "db"),
          blobs_(workspace_.root() / "blobs", "secret") {
        settings_.work_root = workspace_.root() / "work";
        settings_.drain_poll_ms = 10;
        gpu_policy_.check_host_environment = false;
        service_ = std::make_unique<RunService>(
            OrchestratorDeps{plans_, plans_, runs_, blobs_, bus_}, settings_, gpu_policy_);
    }

    ~ServiceFixture() override { service_.reset(); }

    std::string add_plan(const std::string& artifact) {
        const std::string plan_id = "plan-" + sandrun::core::config::generate_run_id();
        EXPECT_FALSE(is_error(plans_.put_plan(plan_id, {{"config", {{"seed", 5}}}}, artifact)));
        return plan_id;
    }

    std::string metrics_of(const std::string& run_id) {
        auto text = blobs_.read_text(
            sandrun::protocol::artifact_key(run_id, sandrun::protocol::kArtifactMetrics));
        return is_error(text) ? std::string() : get_value(text);
    }

    TempWorkspace workspace_;
    sandrun::storage::FilePlanStore plans_;
    sandrun::storage::FileRunStore runs_;
    sandrun::storage::FileBlobStore blobs_;
    sandrun::bus::EventBus bus_;
    sandrun::core::config::Settings settings_;
    sandrun::policy::GpuPolicy gpu_policy_;
    std::unique_ptr<RunService> service_;
};

TEST_F(ServiceFixture, StartRunReturnsPendingOrLaterRun) {
    auto started = service_->start_run(add_plan(units_artifact({kSeededMetrics})));
    ASSERT_FALSE(is_error(started));
    const std::string run_id = get_value(started);
    EXPECT_EQ(run_id.rfind("run-", 0), 0u);

    auto record = service_->get_run(run_id);
    ASSERT_FALSE(is_error(record));
    EXPECT_EQ(get_value(record).id, run_id);

    auto finished = service_->wait(run_id);
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished), RunStatus::Succeeded);
    EXPECT_EQ(service_->run_count(), 1u);
}

TEST_F(ServiceFixture, StreamEndsAfterTerminalEvents) {
    auto started = service_->start_run(add_plan(units_artifact({"echo hi", kSeededMetrics})));
    ASSERT_FALSE(is_error(started));
    const std::string run_id = get_value(started);

    auto events = service_->stream_events(run_id).collect();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().payload.at("stage"), "run_start");
    EXPECT_EQ(events.back().kind, "progress");
    EXPECT_EQ(events.back().payload.at("percent"), 100);

    ASSERT_FALSE(is_error(service_->wait(run_id)));
}

TEST_F(ServiceFixture, ConcurrentRunsAreIsolatedAndDeterministic) {
    const auto plan_id = add_plan(units_artifact({"sleep 0.2", kSeededMetrics}));
    std::vector<std::string> run_ids;
    for (int i = 0; i < 3; ++i) {
        auto started = service_->start_run(plan_id);
        ASSERT_FALSE(is_error(started));
        run_ids.push_back(get_value(started));
    }

    for (const auto& run_id : run_ids) {
        auto finished = service_->wait(run_id);
        ASSERT_FALSE(is_error(finished));
        EXPECT_EQ(get_value(finished), RunStatus::Succeeded);
    }
    const auto expected = metrics_of(run_ids[0]);
    EXPECT_FALSE(expected.empty());
    EXPECT_EQ(metrics_of(run_ids[1]), expected);
    EXPECT_EQ(metrics_of(run_ids[2]), expected);
}

TEST_F(ServiceFixture, FinishedWorkersAreReapedOnNextStart) {
    const auto plan_id = add_plan(units_artifact({kSeededMetrics}));
    auto first = service_->start_run(plan_id);
    ASSERT_FALSE(is_error(first));
    static_cast<void>(service_->stream_events(get_value(first)).collect());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto second = service_->start_run(plan_id);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(service_->pending_workers(), 1u);
    EXPECT_EQ(service_->run_count(), 2u);

    // A reaped run can still be waited on through its record.
    auto first_status = service_->wait(get_value(first));
    ASSERT_FALSE(is_error(first_status));
    EXPECT_EQ(get_value(first_status), RunStatus::Succeeded);
    ASSERT_FALSE(is_error(service_->wait(get_value(second))));
    EXPECT_EQ(service_->pending_workers(), 0u);
}

TEST_F(ServiceFixture, RejectsEmptyPlanId) {
    auto started = service_->start_run("");
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "invalid_run_request");
}

TEST_F(ServiceFixture, UnknownPlanStillProducesFailedRun) {
    auto started = service_->start_run("no-such-plan");
    ASSERT_FALSE(is_error(started));
    const std::string run_id = get_value(started);

    auto finished = service_->wait(run_id);
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished), RunStatus::Failed);
    EXPECT_EQ(get_value(service_->get_run(run_id)).error_code, "plan_not_found");
}

TEST_F(ServiceFixture, WaitOnUnknownRunIsNotFound) {
    auto finished = service_->wait("run-000000000000");
    ASSERT_TRUE(is_error(finished));
    EXPECT_EQ(get_error(finished).code, "run_not_found");
}

}  // namespace
