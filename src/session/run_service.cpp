#include "session/run_service.hpp"

#include <chrono>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace sandrun::session {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::RunError;
using protocol::RunRecord;
using protocol::RunStatus;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

}  // namespace

RunService::RunService(OrchestratorDeps deps, core::config::Settings settings,
                       policy::GpuPolicy gpu_policy)
    : deps_(deps),
      settings_(settings),
      orchestrator_(deps, std::move(settings), std::move(gpu_policy)) {}

RunService::~RunService() {
    std::unordered_map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& [run_id, worker] : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

Result<std::string> RunService::start_run(const std::string& plan_id) {
    if (plan_id.empty()) {
        return RunError{ErrorCategory::Input, "Run request must name a plan.",
                        "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string run_id = core::config::generate_run_id();
        if (workers_.find(run_id) != workers_.end()) {
            continue;
        }

        RunRecord record;
        record.id = run_id;
        record.plan_id = plan_id;
        record.status = RunStatus::Pending;
        record.seed = settings_.default_seed;
        record.created_at_ms = now_unix_ms();
        auto inserted = deps_.runs.insert_run(record);
        if (core::errors::is_error(inserted)) {
            const auto& err = core::errors::get_error(inserted);
            if (err.code == "run_exists") {
                continue;
            }
            return err;
        }

        static_cast<void>(deps_.bus.register_run(run_id));
        LOG_INFO("RunService: run " + run_id + " created for plan " + plan_id);
        auto done = std::make_shared<std::atomic_bool>(false);
        std::thread thread([this, run_id, done]() {
            static_cast<void>(orchestrator_.orchestrate(run_id));
            done->store(true);
        });
        workers_.emplace(run_id, Worker{std::move(thread), done});
        ++started_;
        return run_id;
    }

    return RunError{ErrorCategory::Internal, "Unable to allocate unique run ID.",
                    "run_id_generation_failed"};
}

bus::EventStream RunService::stream_events(const std::string& run_id) const {
    return deps_.bus.stream(run_id);
}

Result<RunRecord> RunService::get_run(const std::string& run_id) const {
    return deps_.runs.get_run(run_id);
}

Result<RunStatus> RunService::wait(const std::string& run_id) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(run_id);
        if (it != workers_.end()) {
            worker = std::move(it->second.thread);
            workers_.erase(it);
        }
    }
    if (worker.joinable()) {
        worker.join();
    }

    auto record = deps_.runs.get_run(run_id);
    if (core::errors::is_error(record)) {
        return core::errors::get_error(record);
    }
    return core::errors::get_value(record).status;
}

std::size_t RunService::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

std::size_t RunService::pending_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void RunService::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->second.done->load()) {
            if (it->second.thread.joinable()) {
                it->second.thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace sandrun::session
