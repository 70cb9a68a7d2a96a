#include "protocol/event_validator.hpp"

#include <cmath>
#include <optional>
#include <type_traits>
#include <utility>

namespace sandrun::protocol {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;

namespace {

RunError invalid_payload(const std::string& kind, const std::string& detail) {
    return RunError{ErrorCategory::Internal,
                    "Invalid " + kind + " payload: " + detail,
                    "invalid_event_payload"};
}

// Returns an error message when the field is missing or not a string.
std::optional<std::string> read_required_string(const json& payload,
                                                const char* key,
                                                std::string& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::string("missing required field '") + key + "'";
    }
    if (!it->is_string()) {
        return std::string("field '") + key + "' must be a string";
    }
    out = it->get<std::string>();
    return std::nullopt;
}

std::optional<std::string> read_optional_string(const json& payload,
                                                const char* key,
                                                std::optional<std::string>& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        out.reset();
        return std::nullopt;
    }
    if (!it->is_string()) {
        return std::string("field '") + key + "' must be a string";
    }
    out = it->get<std::string>();
    return std::nullopt;
}

void put_optional(json& out, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        out[key] = value.value();
    }
}

Result<EventPayload> parse_stage_update(const json& payload) {
    StageUpdateEvent event;
    if (auto err = read_required_string(payload, "stage", event.stage)) {
        return invalid_payload("stage_update", err.value());
    }
    if (auto err = read_optional_string(payload, "run_id", event.run_id)) {
        return invalid_payload("stage_update", err.value());
    }
    return EventPayload{event};
}

Result<EventPayload> parse_progress(const json& payload) {
    ProgressEvent event;
    const auto it = payload.find("percent");
    if (it == payload.end() || it->is_null()) {
        return invalid_payload("progress", "missing required field 'percent'");
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value < 0 || value > 100) {
            return invalid_payload("progress", "percent must be within 0..100");
        }
        event.percent = static_cast<int>(value);
    } else if (it->is_number_float()) {
        const double value = it->get<double>();
        if (std::floor(value) != value) {
            return invalid_payload("progress", "percent must be an integer");
        }
        if (value < 0.0 || value > 100.0) {
            return invalid_payload("progress", "percent must be within 0..100");
        }
        event.percent = static_cast<int>(value);
    } else {
        return invalid_payload("progress", "percent must be a number");
    }
    if (auto err = read_optional_string(payload, "message", event.message)) {
        return invalid_payload("progress", err.value());
    }
    return EventPayload{event};
}

Result<EventPayload> parse_log_line(const json& payload) {
    LogLineEvent event;
    if (auto err = read_required_string(payload, "message", event.message)) {
        return invalid_payload("log_line", err.value());
    }
    return EventPayload{event};
}

Result<EventPayload> parse_metric_update(const json& payload) {
    MetricUpdateEvent event;
    if (auto err = read_required_string(payload, "metric", event.metric)) {
        return invalid_payload("metric_update", err.value());
    }
    const auto it = payload.find("value");
    if (it == payload.end() || it->is_null()) {
        return invalid_payload("metric_update", "missing required field 'value'");
    }
    // json::is_number is false for booleans, which are rejected here.
    if (!it->is_number()) {
        return invalid_payload("metric_update", "value must be a number");
    }
    event.value = it->get<double>();
    if (!std::isfinite(event.value)) {
        return invalid_payload("metric_update", "value must be finite");
    }
    if (auto err = read_optional_string(payload, "split", event.split)) {
        return invalid_payload("metric_update", err.value());
    }
    if (auto err = read_optional_string(payload, "ts", event.ts)) {
        return invalid_payload("metric_update", err.value());
    }
    return EventPayload{event};
}

Result<EventPayload> parse_sample_pred(const json& payload) {
    SamplePredEvent event;
    if (auto err = read_optional_string(payload, "text", event.text)) {
        return invalid_payload("sample_pred", err.value());
    }
    if (auto err = read_optional_string(payload, "label", event.label)) {
        return invalid_payload("sample_pred", err.value());
    }
    if (auto err = read_optional_string(payload, "stage", event.stage)) {
        return invalid_payload("sample_pred", err.value());
    }
    if (auto err = read_optional_string(payload, "ts", event.ts)) {
        return invalid_payload("sample_pred", err.value());
    }
    return EventPayload{event};
}

Result<EventPayload> parse_error(const json& payload) {
    ErrorEvent event;
    if (auto err = read_required_string(payload, "message", event.message)) {
        return invalid_payload("error", err.value());
    }
    if (auto err = read_optional_string(payload, "code", event.code)) {
        return invalid_payload("error", err.value());
    }
    return EventPayload{event};
}

}  // namespace

Result<EventPayload> parse_event(const std::string& kind, const json& payload) {
    const auto known = parse_event_kind(kind);
    if (!known.has_value()) {
        return EventPayload{PassthroughEvent{kind, payload}};
    }
    if (!payload.is_object()) {
        return invalid_payload(kind, "payload must be a JSON object");
    }

    switch (known.value()) {
        case EventKind::StageUpdate:
            return parse_stage_update(payload);
        case EventKind::Progress:
            return parse_progress(payload);
        case EventKind::LogLine:
            return parse_log_line(payload);
        case EventKind::MetricUpdate:
            return parse_metric_update(payload);
        case EventKind::SamplePred:
            return parse_sample_pred(payload);
        case EventKind::Error:
            return parse_error(payload);
    }
    return invalid_payload(kind, "unhandled event kind");
}

json to_payload(const EventPayload& event) {
    return std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            json out = json::object();
            if constexpr (std::is_same_v<T, StageUpdateEvent>) {
                out["stage"] = e.stage;
                put_optional(out, "run_id", e.run_id);
            } else if constexpr (std::is_same_v<T, ProgressEvent>) {
                out["percent"] = e.percent;
                put_optional(out, "message", e.message);
            } else if constexpr (std::is_same_v<T, LogLineEvent>) {
                out["message"] = e.message;
            } else if constexpr (std::is_same_v<T, MetricUpdateEvent>) {
                out["metric"] = e.metric;
                out["value"] = e.value;
                put_optional(out, "split", e.split);
                put_optional(out, "ts", e.ts);
            } else if constexpr (std::is_same_v<T, SamplePredEvent>) {
                put_optional(out, "text", e.text);
                put_optional(out, "label", e.label);
                put_optional(out, "stage", e.stage);
                put_optional(out, "ts", e.ts);
            } else if constexpr (std::is_same_v<T, ErrorEvent>) {
                out["message"] = e.message;
                put_optional(out, "code", e.code);
            } else {
                out = e.payload;
            }
            return out;
        },
        event);
}

std::string kind_of(const EventPayload& event) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StageUpdateEvent>) {
                return to_string(EventKind::StageUpdate);
            } else if constexpr (std::is_same_v<T, ProgressEvent>) {
                return to_string(EventKind::Progress);
            } else if constexpr (std::is_same_v<T, LogLineEvent>) {
                return to_string(EventKind::LogLine);
            } else if constexpr (std::is_same_v<T, MetricUpdateEvent>) {
                return to_string(EventKind::MetricUpdate);
            } else if constexpr (std::is_same_v<T, SamplePredEvent>) {
                return to_string(EventKind::SamplePred);
            } else if constexpr (std::is_same_v<T, ErrorEvent>) {
                return to_string(EventKind::Error);
            } else {
                return e.kind;
            }
        },
        event);
}

Result<json> validate_event(const std::string& kind, const json& payload) {
    auto parsed = parse_event(kind, payload);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return to_payload(core::errors::get_value(parsed));
}

std::string to_valid_utf8(const std::string& text) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        unsigned char min_next = 0x80;
        unsigned char max_next = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_next = 0xA0;
            if (lead == 0xED) max_next = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_next = 0x90;
            if (lead == 0xF4) max_next = 0x8F;
        }

        bool valid = length > 0 && i + length <= text.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            const unsigned char low = k == 1 ? min_next : 0x80;
            const unsigned char high = k == 1 ? max_next : 0xBF;
            valid = next >= low && next <= high;
        }

        if (valid) {
            out.append(text, i, length);
            i += length;
        } else {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

std::string dump_line(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

RawEvent make_raw(const EventPayload& event) {
    return RawEvent{kind_of(event), to_payload(event)};
}

}  // namespace sandrun::protocol
