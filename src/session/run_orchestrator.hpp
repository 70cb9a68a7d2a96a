#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/event_bus.hpp"
#include "core/config/settings.hpp"
#include "core/errors/run_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_contract.hpp"
#include "storage/blob_store.hpp"
#include "storage/plan_store.hpp"
#include "storage/run_store.hpp"

namespace sandrun::session {

// Everything the orchestrator reads from and writes to. Owned by the
// caller and shared across runs.
struct OrchestratorDeps {
    storage::PlanResolver& plans;
    storage::ArtifactSource& artifacts;
    storage::RunStore& runs;
    storage::BlobStore& blobs;
    bus::EventBus& bus;
};

// Deadline in milliseconds for a plan budget in minutes, clamped to the
// configured floor and ceiling. A missing budget gets the ceiling.
std::uint32_t deadline_ms_for(const std::optional<std::uint32_t>& budget_minutes,
                              const core::config::Settings& settings);

class RunOrchestrator {
public:
    RunOrchestrator(OrchestratorDeps deps, core::config::Settings settings,
                    policy::GpuPolicy gpu_policy = {});

    // Drives one pending run to a terminal status: resolve the plan, execute
    // the artifact under its deadline, govern and persist the artifacts.
    // Every path ends with the run's bus channel closed. Never throws.
    protocol::RunStatus orchestrate(const std::string& run_id);

private:
    struct RunContext {
        protocol::RunRecord record;
        std::int64_t started_at_ms = 0;
        std::int64_t last_ts_ms = 0;
        std::int64_t seq = 0;
        std::vector<std::string> log_lines;
        std::string events_text;
        std::map<std::string, std::int64_t> series_steps;
        std::optional<core::errors::RunError> validation_failure;
        bool failing = false;
    };

    protocol::RunStatus run(RunContext& ctx);

    void publish(RunContext& ctx, const std::string& kind, const nlohmann::json& payload);
    void publish(RunContext& ctx, const protocol::EventPayload& event);

    // Validates one sandbox event and forwards it to the bus, the durable
    // event log and, for metric samples, the series.
    void forward(RunContext& ctx, const protocol::RawEvent& raw);

    protocol::RunStatus succeed(RunContext& ctx, protocol::RunArtifacts artifacts);
    protocol::RunStatus fail(RunContext& ctx, core::errors::FailureKind kind,
                             const std::string& raw_message);

    void emit_warnings(RunContext& ctx, const std::vector<std::string>& warnings);
    core::errors::Result<core::errors::Ok> persist_artifact(
        const std::string& run_id, const char* name, const std::string& text,
        const std::string& content_type);
    void close_channel(const std::string& run_id);

    OrchestratorDeps deps_;
    core::config::Settings settings_;
    policy::GpuPolicy gpu_policy_;
};

}  // namespace sandrun::session
