#include "sandbox/execution_sandbox.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/event_validator.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/unit_artifact.hpp"

namespace sandrun::sandbox {

using core::errors::ErrorCategory;
using core::errors::FailureKind;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;
using protocol::LogLineEvent;
using protocol::ProgressEvent;
using protocol::RunArtifacts;
using protocol::StageUpdateEvent;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> printable_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(protocol::to_valid_utf8(text));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

// Writes every emitted event to the channel and into the `events` artifact.
class Emitter {
public:
    explicit Emitter(EventChannel& channel) : channel_(channel) {}

    void emit(const protocol::EventPayload& event) { emit(protocol::make_raw(event)); }

    void emit(protocol::RawEvent event) {
        json line;
        line["ts_unix_ms"] = now_unix_ms();
        line["kind"] = event.kind;
        line["payload"] = event.payload;
        events_text_ += protocol::dump_line(line);
        events_text_.push_back('\n');
        static_cast<void>(channel_.push(std::move(event)));
    }

    void log_line(const std::string& message, std::vector<std::string>* logs) {
        if (logs != nullptr) {
            logs->push_back(message);
        }
        emit(LogLineEvent{message});
    }

    const std::string& events_text() const { return events_text_; }

private:
    EventChannel& channel_;
    std::string events_text_;
};

// Private working directory, removed when the run finishes.
class RunWorkspace {
public:
    explicit RunWorkspace(std::filesystem::path root) : root_(std::move(root)) {}

    ~RunWorkspace() {
        if (created_) {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }
    }

    RunWorkspace(const RunWorkspace&) = delete;
    RunWorkspace& operator=(const RunWorkspace&) = delete;

    bool create() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_, ec);
        created_ = !ec;
        return created_;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    bool created_ = false;
};

std::optional<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Emits the structured events a unit appended to events.jsonl since the
// last flush. Returns the number of lines consumed so far.
std::size_t flush_unit_events(const std::filesystem::path& events_path,
                              Emitter& emitter, const std::size_t start_index) {
    const auto text = read_text_file(events_path);
    if (!text.has_value()) {
        return start_index;
    }

    std::vector<std::string> raw_lines;
    std::istringstream in(text.value());
    std::string line;
    while (std::getline(in, line)) {
        raw_lines.push_back(line);
    }

    for (std::size_t i = start_index; i < raw_lines.size(); ++i) {
        const std::string payload_raw = trim(raw_lines[i]);
        if (payload_raw.empty()) {
            continue;
        }
        json payload = json::parse(payload_raw, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            LOG_DEBUG("Sandbox: skipping malformed event line " + std::to_string(i + 1));
            continue;
        }
        const auto type = payload.find("type");
        if (type == payload.end() || !type->is_string()) {
            continue;
        }
        std::string kind = type->get<std::string>();
        payload.erase("type");
        emitter.emit(protocol::RawEvent{std::move(kind), std::move(payload)});
    }
    return std::max(start_index, raw_lines.size());
}

std::string join_logs(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

RunError unit_failure(const ExecutionUnit& unit, const ProcessCapture& capture) {
    std::string detail = trim(protocol::to_valid_utf8(capture.stderr_text));
    if (detail.empty()) {
        detail = "exit status " + std::to_string(capture.exit_code);
    }
    return RunError{ErrorCategory::Execution,
                    "Unit " + unit.id + " failed: " + detail,
                    "unit_failed", "", FailureKind::ExecutionError};
}

RunError cancelled_error() {
    return RunError{ErrorCategory::Execution,
                    "Sandbox execution cancelled at the caller's deadline",
                    "sandbox_cancelled", "", FailureKind::RunTimeout};
}

}  // namespace

ExecutionSandbox::ExecutionSandbox(policy::GpuPolicy gpu_policy)
    : gpu_policy_(std::move(gpu_policy)) {}

Result<RunArtifacts> ExecutionSandbox::execute(const SandboxRequest& request,
                                               EventChannel& channel) const {
    Emitter emitter(channel);
    std::vector<std::string> logs;

    auto parsed = parse_unit_artifact(request.artifact_bytes);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const UnitArtifact& artifact = core::errors::get_value(parsed);

    // 1. CPU only, checked before anything runs.
    const policy::PolicyGuard policy_guard(gpu_policy_);
    auto cpu_only = policy_guard.enforce_cpu_only(artifact.env, artifact.requires_gpu);
    if (core::errors::is_error(cpu_only)) {
        LOG_ERROR("Sandbox: " + core::errors::get_error(cpu_only).message);
        return core::errors::get_error(cpu_only);
    }
    emitter.log_line("Environment: /bin/sh units, CPU-only mode", &logs);

    // 2. Deterministic seeding for every unit process.
    const std::string seed_text = std::to_string(request.seed);
    std::map<std::string, std::string> env = artifact.env;
    for (const auto& [key, value] : policy_guard.cpu_only_environment()) {
        env[key] = value;
    }
    env["SANDRUN_SEED"] = seed_text;
    env["PYTHONHASHSEED"] = seed_text;
    env["RANDOM"] = seed_text;
    env["LC_ALL"] = "C";
    env["TZ"] = "UTC";
    emitter.emit(StageUpdateEvent{protocol::kStageSeedCheck, std::nullopt});
    emitter.log_line("seed set: " + seed_text, &logs);

    RunWorkspace workspace(request.work_root /
                           (request.run_id + "-" + core::config::random_hex(6)));
    if (!workspace.create()) {
        return RunError{ErrorCategory::Internal,
                        "Unable to create sandbox working directory: " +
                            workspace.root().string(),
                        "workspace_create_failed"};
    }

    const auto events_path = workspace.root() / kUnitEventsFile;
    std::size_t processed_events = 0;
    const std::size_t total = artifact.units.size();

    for (std::size_t index = 0; index < total; ++index) {
        if (request.cancel_token && request.cancel_token->load()) {
            return cancelled_error();
        }

        const ExecutionUnit& unit = artifact.units[index];
        LOG_DEBUG("Sandbox: unit " + unit.id + " (" + std::to_string(index + 1) +
                  "/" + std::to_string(total) + ") starting");

        ProcessRequest process_request;
        process_request.script = unit.source;
        process_request.working_directory = workspace.root();
        process_request.env_overrides = env;
        process_request.timeout_ms = request.unit_timeout_ms;
        process_request.cancel_token = request.cancel_token;

        auto capture_result = run_process(process_request);
        if (core::errors::is_error(capture_result)) {
            return core::errors::get_error(capture_result);
        }
        const ProcessCapture& capture = core::errors::get_value(capture_result);

        for (const auto& line : printable_lines(capture.stdout_text)) {
            emitter.log_line(line, &logs);
        }
        for (const auto& line : printable_lines(capture.stderr_text)) {
            emitter.log_line(line, &logs);
        }
        processed_events = flush_unit_events(events_path, emitter, processed_events);

        if (capture.cancelled) {
            return cancelled_error();
        }
        if (capture.timed_out) {
            return RunError{ErrorCategory::Execution,
                            "Unit " + unit.id + " exceeded " +
                                std::to_string(request.unit_timeout_ms) + " ms",
                            "unit_timed_out", "", FailureKind::RunTimeout};
        }
        if (capture.exit_code != 0) {
            LOG_WARN("Sandbox: unit " + unit.id + " exited with status " +
                     std::to_string(capture.exit_code));
            return unit_failure(unit, capture);
        }

        const int percent = static_cast<int>(((index + 1) * 100) / total);
        emitter.emit(ProgressEvent{percent, std::nullopt});
    }

    const auto metrics = read_text_file(workspace.root() / kUnitMetricsFile);
    if (!metrics.has_value()) {
        return RunError{ErrorCategory::Execution,
                        std::string(kUnitMetricsFile) + " not produced by the artifact",
                        "metrics_missing", "", FailureKind::ExecutionError};
    }

    processed_events = flush_unit_events(events_path, emitter, processed_events);

    if (const auto unit_logs = read_text_file(workspace.root() / kUnitLogsFile)) {
        for (const auto& line : printable_lines(unit_logs.value())) {
            logs.push_back(line);
        }
    }

    RunArtifacts artifacts;
    artifacts.metrics = metrics.value();
    artifacts.events = emitter.events_text();
    artifacts.logs = join_logs(logs);
    LOG_INFO("Sandbox: " + std::to_string(total) + " units completed, " +
             std::to_string(processed_events) + " unit event lines");
    return artifacts;
}

}  // namespace sandrun::sandbox
