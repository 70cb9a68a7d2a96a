#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace sandrun::protocol {

    // Fixed vocabulary of run event kinds
    enum class EventKind {
        StageUpdate,    // Phase entry (run_start, train, run_complete, ...)
        Progress,       // Coarse completion estimate
        LogLine,        // One free-text output line
        MetricUpdate,   // A scalar metric sample
        SamplePred,     // A qualitative sample prediction
        Error           // Terminal or recoverable error signal
    };

    // Well-known stage names the orchestrator and sandbox emit
    inline constexpr const char* kStageRunStart = "run_start";
    inline constexpr const char* kStageRunComplete = "run_complete";
    inline constexpr const char* kStageRunError = "run_error";
    inline constexpr const char* kStageSeedCheck = "seed_check";

    struct StageUpdateEvent {
        std::string stage;
        std::optional<std::string> run_id;
    };

    struct ProgressEvent {
        int percent = 0;
        std::optional<std::string> message;
    };

    struct LogLineEvent {
        std::string message;
    };

    struct MetricUpdateEvent {
        std::string metric;
        double value = 0.0;
        std::optional<std::string> split;
        std::optional<std::string> ts;
    };

    struct SamplePredEvent {
        std::optional<std::string> text;
        std::optional<std::string> label;
        std::optional<std::string> stage;
        std::optional<std::string> ts;
    };

    struct ErrorEvent {
        std::string message;
        std::optional<std::string> code;
    };

    // Any kind outside the vocabulary, carried through untouched.
    struct PassthroughEvent {
        std::string kind;
        nlohmann::json payload;
    };

    // A run event is exactly ONE of the kinds below.
    using EventPayload = std::variant<
        StageUpdateEvent,
        ProgressEvent,
        LogLineEvent,
        MetricUpdateEvent,
        SamplePredEvent,
        ErrorEvent,
        PassthroughEvent
    >;

    // What the sandbox writes into its event channel, before validation.
    struct RawEvent {
        std::string kind;
        nlohmann::json payload = nlohmann::json::object();
    };

    // A validated event as distributed on the bus and persisted.
    struct RunEvent {
        std::string run_id;
        std::int64_t seq = 0;
        std::int64_t ts_unix_ms = 0;
        std::string kind;
        nlohmann::json payload = nlohmann::json::object();
    };

    inline std::string to_string(const EventKind kind) {
        switch (kind) {
            case EventKind::StageUpdate:
                return "stage_update";
            case EventKind::Progress:
                return "progress";
            case EventKind::LogLine:
                return "log_line";
            case EventKind::MetricUpdate:
                return "metric_update";
            case EventKind::SamplePred:
                return "sample_pred";
            case EventKind::Error:
                return "error";
            default:
                return "unknown";
        }
    }

    inline std::optional<EventKind> parse_event_kind(const std::string& kind) {
        if (kind == "stage_update") return EventKind::StageUpdate;
        if (kind == "progress") return EventKind::Progress;
        if (kind == "log_line") return EventKind::LogLine;
        if (kind == "metric_update") return EventKind::MetricUpdate;
        if (kind == "sample_pred") return EventKind::SamplePred;
        if (kind == "error") return EventKind::Error;
        return std::nullopt;
    }

    // Wire shape used by the artifact and the persisted event log
    inline nlohmann::json to_json(const RunEvent& event) {
        nlohmann::json out;
        out["run_id"] = event.run_id;
        out["seq"] = event.seq;
        out["ts_unix_ms"] = event.ts_unix_ms;
        out["kind"] = event.kind;
        out["payload"] = event.payload;
        return out;
    }

} // namespace sandrun::protocol
