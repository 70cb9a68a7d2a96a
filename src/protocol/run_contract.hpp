#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandrun::protocol {

enum class RunStatus {
    Pending,
    Running,
    Succeeded,
    Failed
};

// Artifact file names under the per-run namespace runs/<run_id>/
inline constexpr const char* kArtifactMetrics = "metrics.json";
inline constexpr const char* kArtifactEvents = "events.jsonl";
inline constexpr const char* kArtifactLogs = "logs.txt";

// Appended to an artifact cut short by the size governor.
inline constexpr std::string_view kTruncationMarker = "\n[TRUNC]\n";

struct RunRecord {
    std::string id;
    std::string plan_id;
    RunStatus status = RunStatus::Pending;
    std::string env_hash;
    std::int64_t seed = 42;
    std::int64_t created_at_ms = 0;
    std::optional<std::int64_t> started_at_ms;
    std::optional<std::int64_t> completed_at_ms;
    std::optional<std::int64_t> duration_sec;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
};

// Partial update applied by RunStore::update_run; unset fields are untouched.
struct RunUpdate {
    std::optional<RunStatus> status;
    std::optional<std::string> env_hash;
    std::optional<std::int64_t> seed;
    std::optional<std::int64_t> started_at_ms;
    std::optional<std::int64_t> completed_at_ms;
    std::optional<std::int64_t> duration_sec;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
};

struct SeriesPoint {
    std::string run_id;
    std::string metric;
    std::optional<std::string> split;
    std::int64_t step = 1;
    double value = 0.0;
    std::int64_t ts_unix_ms = 0;
};

struct RunArtifacts {
    std::string metrics;
    std::string events;
    std::string logs;
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Pending:
            return "pending";
        case RunStatus::Running:
            return "running";
        case RunStatus::Succeeded:
            return "succeeded";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::optional<RunStatus> parse_run_status(const std::string& text) {
    if (text == "pending") return RunStatus::Pending;
    if (text == "running") return RunStatus::Running;
    if (text == "succeeded") return RunStatus::Succeeded;
    if (text == "failed") return RunStatus::Failed;
    return std::nullopt;
}

inline bool is_terminal(const RunStatus status) {
    return status == RunStatus::Succeeded || status == RunStatus::Failed;
}

// pending -> running -> {succeeded, failed}, plus pending -> failed for a
// plan that never resolved.
inline bool can_transition(const RunStatus from, const RunStatus to) {
    switch (from) {
        case RunStatus::Pending:
            return to == RunStatus::Running || to == RunStatus::Failed;
        case RunStatus::Running:
            return to == RunStatus::Succeeded || to == RunStatus::Failed;
        default:
            return false;
    }
}

inline std::string artifact_key(const std::string& run_id, const char* name) {
    return "runs/" + run_id + "/" + name;
}

}  // namespace sandrun::protocol
