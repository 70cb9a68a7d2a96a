#include "session/run_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <limits>
#include <memory>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/event_validator.hpp"
#include "protocol/plan_contract.hpp"
#include "sandbox/event_channel.hpp"
#include "sandbox/execution_sandbox.hpp"
#include "session/artifact_governor.hpp"

namespace sandrun::session {

using core::errors::FailureKind;
using core::errors::Ok;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;
using protocol::RunArtifacts;
using protocol::RunStatus;
using protocol::RunUpdate;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

}  // namespace

std::uint32_t deadline_ms_for(const std::optional<std::uint32_t>& budget_minutes,
                              const core::config::Settings& settings) {
    const std::uint32_t budget = std::clamp(
        budget_minutes.value_or(settings.budget_ceiling_minutes),
        settings.budget_floor_minutes, settings.budget_ceiling_minutes);
    const std::uint64_t total =
        static_cast<std::uint64_t>(budget) * settings.budget_unit_ms;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(
        total, std::numeric_limits<std::uint32_t>::max()));
}

RunOrchestrator::RunOrchestrator(OrchestratorDeps deps, core::config::Settings settings,
                                 policy::GpuPolicy gpu_policy)
    : deps_(deps), settings_(std::move(settings)), gpu_policy_(std::move(gpu_policy)) {}

RunStatus RunOrchestrator::orchestrate(const std::string& run_id) {
    core::logging::ScopedRunId scoped(run_id);
    static_cast<void>(deps_.bus.register_run(run_id));

    auto loaded = deps_.runs.get_run(run_id);
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        LOG_ERROR("Orchestrator: cannot load run [" + err.code + "]: " + err.message);
        close_channel(run_id);
        return RunStatus::Failed;
    }

    RunContext ctx;
    ctx.record = core::errors::get_value(loaded);
    if (ctx.record.status != RunStatus::Pending) {
        LOG_WARN("Orchestrator: run is already " + protocol::to_string(ctx.record.status));
        close_channel(run_id);
        return ctx.record.status;
    }

    try {
        return run(ctx);
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Orchestrator: unexpected exception: ") + ex.what());
        if (ctx.failing) {
            // The terminal events were already attempted once.
            close_channel(run_id);
            return RunStatus::Failed;
        }
        try {
            return fail(ctx, FailureKind::UnexpectedError, ex.what());
        } catch (const std::exception& cleanup) {
            LOG_ERROR(std::string("Orchestrator: failure cleanup aborted: ") + cleanup.what());
            close_channel(run_id);
            return RunStatus::Failed;
        }
    }
}

RunStatus RunOrchestrator::run(RunContext& ctx) {
    const std::string run_id = ctx.record.id;

    auto resolved = deps_.plans.get_plan(ctx.record.plan_id);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        return fail(ctx, err.failure.value_or(FailureKind::PlanNotFound), err.message);
    }
    const protocol::PlanDocument& plan = core::errors::get_value(resolved);
    const std::int64_t seed = plan.seed.value_or(settings_.default_seed);

    ctx.started_at_ms = now_unix_ms();
    RunUpdate running;
    running.status = RunStatus::Running;
    running.started_at_ms = ctx.started_at_ms;
    running.env_hash = protocol::compute_env_hash(plan);
    running.seed = seed;
    auto moved = deps_.runs.update_run(run_id, running);
    if (core::errors::is_error(moved)) {
        return fail(ctx, FailureKind::UnexpectedError,
                    core::errors::get_error(moved).message);
    }
    ctx.record = core::errors::get_value(moved);

    publish(ctx, protocol::StageUpdateEvent{protocol::kStageRunStart, run_id});
    publish(ctx, protocol::ProgressEvent{0, std::nullopt});

    auto requirements = persist_artifact(run_id, "requirements.txt",
                                         protocol::requirements_text(plan), "text/plain");
    if (core::errors::is_error(requirements)) {
        LOG_WARN("Orchestrator: " + core::errors::get_error(requirements).message);
    }

    auto downloaded = deps_.artifacts.download_artifact(ctx.record.plan_id);
    if (core::errors::is_error(downloaded)) {
        const auto& err = core::errors::get_error(downloaded);
        return fail(ctx, core::errors::failure_of(err), err.message);
    }

    const std::uint32_t deadline_ms = deadline_ms_for(plan.budget_minutes, settings_);
    LOG_INFO("Orchestrator: executing plan " + ctx.record.plan_id + " with seed " +
             std::to_string(seed) + ", deadline " + std::to_string(deadline_ms) + " ms");

    sandbox::SandboxRequest request;
    request.run_id = run_id;
    request.artifact_bytes = core::errors::get_value(downloaded);
    request.seed = seed;
    request.unit_timeout_ms = deadline_ms;
    request.work_root = settings_.work_root;
    request.cancel_token = std::make_shared<std::atomic_bool>(false);

    // The worker owns copies of everything it touches so it can outlive
    // this call after a timeout.
    auto channel = std::make_shared<sandbox::EventChannel>();
    auto outcome = std::make_shared<std::promise<Result<RunArtifacts>>>();
    std::future<Result<RunArtifacts>> finished = outcome->get_future();
    std::thread worker([executor = sandbox::ExecutionSandbox(gpu_policy_), request,
                        channel, outcome]() {
        core::logging::ScopedRunId worker_scope(request.run_id);
        try {
            outcome->set_value(executor.execute(request, *channel));
        } catch (...) {
            outcome->set_exception(std::current_exception());
        }
        channel->close();
    });
    worker.detach();

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(deadline_ms);
    const std::chrono::milliseconds poll(settings_.drain_poll_ms);
    bool timed_out = false;

    while (!ctx.validation_failure.has_value()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        protocol::RawEvent raw;
        if (channel->try_pop(raw, poll)) {
            forward(ctx, raw);
            continue;
        }
        if (finished.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            for (const auto& rest : channel->drain()) {
                forward(ctx, rest);
            }
            break;
        }
    }

    if (timed_out || ctx.validation_failure.has_value()) {
        request.cancel_token->store(true);
        channel->close();
        if (!timed_out) {
            return fail(ctx, FailureKind::UnexpectedError,
                        ctx.validation_failure->message);
        }
        // Events queued before the deadline still belong to the run.
        for (const auto& rest : channel->drain()) {
            forward(ctx, rest);
        }
        return fail(ctx, FailureKind::RunTimeout,
                    "Run exceeded its compute budget of " +
                        std::to_string(deadline_ms) + " ms");
    }

    auto executed = finished.get();
    if (core::errors::is_error(executed)) {
        const auto& err = core::errors::get_error(executed);
        return fail(ctx, core::errors::failure_of(err), err.message);
    }
    return succeed(ctx, core::errors::get_value(executed));
}

void RunOrchestrator::publish(RunContext& ctx, const std::string& kind,
                              const json& payload) {
    protocol::RunEvent event;
    event.run_id = ctx.record.id;
    event.seq = ++ctx.seq;
    event.ts_unix_ms = std::max(now_unix_ms(), ctx.last_ts_ms);
    ctx.last_ts_ms = event.ts_unix_ms;
    event.kind = kind;
    event.payload = payload;

    static_cast<void>(deps_.bus.publish(event));
    auto appended = deps_.runs.append_event(event);
    if (core::errors::is_error(appended)) {
        LOG_WARN("Orchestrator: event " + std::to_string(event.seq) +
                 " not persisted: " + core::errors::get_error(appended).message);
    }
}

void RunOrchestrator::publish(RunContext& ctx, const protocol::EventPayload& event) {
    publish(ctx, protocol::kind_of(event), protocol::to_payload(event));
}

void RunOrchestrator::forward(RunContext& ctx, const protocol::RawEvent& raw) {
    auto validated = protocol::validate_event(raw.kind, raw.payload);
    if (core::errors::is_error(validated)) {
        const auto& err = core::errors::get_error(validated);
        if (settings_.validation_mode == core::config::ValidationMode::Strict) {
            LOG_ERROR("Orchestrator: rejecting " + raw.kind + ": " + err.message);
            ctx.validation_failure = err;
        } else {
            LOG_WARN("Orchestrator: dropping " + raw.kind + ": " + err.message);
        }
        return;
    }
    const json& payload = core::errors::get_value(validated);

    publish(ctx, raw.kind, payload);

    json line;
    line["ts_unix_ms"] = ctx.last_ts_ms;
    line["kind"] = raw.kind;
    line["payload"] = payload;
    ctx.events_text += protocol::dump_line(line);
    ctx.events_text.push_back('\n');

    const auto kind = protocol::parse_event_kind(raw.kind);
    if (kind == protocol::EventKind::LogLine) {
        ctx.log_lines.push_back(payload.at("message").get<std::string>());
    } else if (kind == protocol::EventKind::MetricUpdate) {
        protocol::SeriesPoint point;
        point.run_id = ctx.record.id;
        point.metric = payload.at("metric").get<std::string>();
        if (payload.contains("split")) {
            point.split = payload.at("split").get<std::string>();
        }
        point.step = ++ctx.series_steps[point.metric];
        point.value = payload.at("value").get<double>();
        point.ts_unix_ms = ctx.last_ts_ms;
        auto appended = deps_.runs.append_series_point(point);
        if (core::errors::is_error(appended)) {
            LOG_WARN("Orchestrator: series point for " + point.metric +
                     " not persisted: " + core::errors::get_error(appended).message);
        }
    }
}

RunStatus RunOrchestrator::succeed(RunContext& ctx, RunArtifacts artifacts) {
    const std::string run_id = ctx.record.id;
    const ArtifactGovernor governor(settings_.max_logs_bytes, settings_.max_events_bytes);
    emit_warnings(ctx, governor.apply(artifacts));

    struct Output {
        const char* name;
        const std::string& text;
        const char* content_type;
    };
    const Output outputs[] = {
        {protocol::kArtifactMetrics, artifacts.metrics, "application/json"},
        {protocol::kArtifactEvents, artifacts.events, "application/x-ndjson"},
        {protocol::kArtifactLogs, artifacts.logs, "text/plain"},
    };
    for (const auto& output : outputs) {
        auto stored = persist_artifact(run_id, output.name, output.text, output.content_type);
        if (core::errors::is_error(stored)) {
            return fail(ctx, FailureKind::UnexpectedError,
                        core::errors::get_error(stored).message);
        }
    }

    const std::int64_t completed_at = now_unix_ms();
    RunUpdate done;
    done.status = RunStatus::Succeeded;
    done.completed_at_ms = completed_at;
    done.duration_sec = (completed_at - ctx.started_at_ms) / 1000;
    auto updated = deps_.runs.update_run(run_id, done);
    if (core::errors::is_error(updated)) {
        return fail(ctx, FailureKind::UnexpectedError,
                    core::errors::get_error(updated).message);
    }

    publish(ctx, protocol::StageUpdateEvent{protocol::kStageRunComplete, std::nullopt});
    publish(ctx, protocol::ProgressEvent{100, std::nullopt});
    LOG_INFO("Orchestrator: run succeeded in " +
             std::to_string(done.duration_sec.value()) + " s");
    close_channel(run_id);
    return RunStatus::Succeeded;
}

RunStatus RunOrchestrator::fail(RunContext& ctx, const FailureKind kind,
                                const std::string& raw_message) {
    ctx.failing = true;
    const std::string run_id = ctx.record.id;
    const std::string message = protocol::to_valid_utf8(raw_message);
    const std::string code = core::errors::to_code(kind);
    LOG_ERROR("Orchestrator: run failed [" + code + "]: " + message);

    RunArtifacts partial;
    partial.events = ctx.events_text;
    partial.logs = join_lines(ctx.log_lines);
    const ArtifactGovernor governor(settings_.max_logs_bytes, settings_.max_events_bytes);
    emit_warnings(ctx, governor.apply(partial));

    publish(ctx, protocol::StageUpdateEvent{protocol::kStageRunError, std::nullopt});
    publish(ctx, protocol::ErrorEvent{message, code});

    const std::int64_t completed_at = now_unix_ms();
    RunUpdate failed;
    failed.status = RunStatus::Failed;
    failed.completed_at_ms = completed_at;
    if (ctx.started_at_ms > 0) {
        failed.duration_sec = (completed_at - ctx.started_at_ms) / 1000;
    }
    failed.error_code = code;
    failed.error_message = message;
    auto updated = deps_.runs.update_run(run_id, failed);
    if (core::errors::is_error(updated)) {
        LOG_ERROR("Orchestrator: failed status not persisted: " +
                  core::errors::get_error(updated).message);
    }

    if (!partial.logs.empty()) {
        auto stored = persist_artifact(run_id, protocol::kArtifactLogs, partial.logs,
                                       "text/plain");
        if (core::errors::is_error(stored)) {
            LOG_WARN("Orchestrator: " + core::errors::get_error(stored).message);
        }
    }
    if (!partial.events.empty()) {
        auto stored = persist_artifact(run_id, protocol::kArtifactEvents, partial.events,
                                       "application/x-ndjson");
        if (core::errors::is_error(stored)) {
            LOG_WARN("Orchestrator: " + core::errors::get_error(stored).message);
        }
    }

    close_channel(run_id);
    return RunStatus::Failed;
}

void RunOrchestrator::emit_warnings(RunContext& ctx,
                                    const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        publish(ctx, protocol::LogLineEvent{warning});
    }
}

Result<Ok> RunOrchestrator::persist_artifact(const std::string& run_id, const char* name,
                                             const std::string& text,
                                             const std::string& content_type) {
    auto stored = deps_.blobs.put_text(protocol::artifact_key(run_id, name), text,
                                       content_type);
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    return Ok{};
}

void RunOrchestrator::close_channel(const std::string& run_id) {
    if (!deps_.bus.close(run_id)) {
        LOG_WARN("Orchestrator: event channel was already closed");
    }
}

}  // namespace sandrun::session
