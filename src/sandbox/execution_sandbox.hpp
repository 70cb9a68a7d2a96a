#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/run_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/run_contract.hpp"
#include "sandbox/event_channel.hpp"

namespace sandrun::sandbox {

// Files a unit may write into its working directory.
inline constexpr const char* kUnitMetricsFile = "metrics.json";
inline constexpr const char* kUnitEventsFile = "events.jsonl";
inline constexpr const char* kUnitLogsFile = "logs.txt";

struct SandboxRequest {
    std::string run_id;
    std::string artifact_bytes;
    std::int64_t seed = 42;
    // Per-unit ceiling; the caller owns the overall deadline.
    std::uint32_t unit_timeout_ms = 0;
    std::filesystem::path work_root;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class ExecutionSandbox {
public:
    explicit ExecutionSandbox(policy::GpuPolicy gpu_policy = {});

    // Runs every unit of the artifact in order. Events go to `channel` as
    // they happen; the returned artifacts hold metrics, every emitted event
    // as JSON Lines and the printed output. Errors carry a FailureKind of
    // GpuRequested or ExecutionError; RunTimeout when cancelled.
    core::errors::Result<protocol::RunArtifacts> execute(
        const SandboxRequest& request, EventChannel& channel) const;

private:
    policy::GpuPolicy gpu_policy_;
};

}  // namespace sandrun::sandbox
