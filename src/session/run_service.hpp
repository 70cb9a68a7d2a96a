#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "bus/event_bus.hpp"
#include "core/config/settings.hpp"
#include "core/errors/run_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/run_contract.hpp"
#include "session/run_orchestrator.hpp"

namespace sandrun::session {

// Entry point for callers: creates runs, orchestrates each on its own
// thread and exposes their event streams.
class RunService {
public:
    RunService(OrchestratorDeps deps, core::config::Settings settings,
               policy::GpuPolicy gpu_policy = {});
    ~RunService();

    RunService(const RunService&) = delete;
    RunService& operator=(const RunService&) = delete;

    // Inserts a pending run for `plan_id` and returns its id immediately.
    core::errors::Result<std::string> start_run(const std::string& plan_id);

    // Full history, then live events until the run ends.
    bus::EventStream stream_events(const std::string& run_id) const;

    core::errors::Result<protocol::RunRecord> get_run(const std::string& run_id) const;

    // Blocks until the run's orchestration finishes and returns its status.
    core::errors::Result<protocol::RunStatus> wait(const std::string& run_id);

    std::size_t run_count() const;

    // Worker threads not yet joined; finished ones are reaped on the next
    // start_run.
    std::size_t pending_workers() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    // Joins workers whose orchestration has returned. Caller holds mutex_.
    void reap_finished_locked();

    OrchestratorDeps deps_;
    core::config::Settings settings_;
    RunOrchestrator orchestrator_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Worker> workers_;
    std::size_t started_ = 0;
};

}  // namespace sandrun::session
