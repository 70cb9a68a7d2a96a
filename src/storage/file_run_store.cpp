#include "storage/file_run_store.hpp"

#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/event_validator.hpp"
#include "storage/file_io.hpp"

namespace sandrun::storage {

using core::errors::ErrorCategory;
using core::errors::Ok;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;
using protocol::RunEvent;
using protocol::RunRecord;
using protocol::SeriesPoint;

namespace {

constexpr const char* kRecordFile = "run.json";
constexpr const char* kEventsFile = "events.jsonl";
constexpr const char* kSeriesFile = "series.jsonl";

template <typename T>
void put_optional(json& out, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        out[key] = value.value();
    } else {
        out[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const json& in, const char* key) {
    const auto it = in.find(key);
    if (it == in.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

json record_to_json(const RunRecord& record) {
    json out;
    out["id"] = record.id;
    out["plan_id"] = record.plan_id;
    out["status"] = protocol::to_string(record.status);
    out["env_hash"] = record.env_hash;
    out["seed"] = record.seed;
    out["created_at_ms"] = record.created_at_ms;
    put_optional(out, "started_at_ms", record.started_at_ms);
    put_optional(out, "completed_at_ms", record.completed_at_ms);
    put_optional(out, "duration_sec", record.duration_sec);
    put_optional(out, "error_code", record.error_code);
    put_optional(out, "error_message", record.error_message);
    return out;
}

Result<RunRecord> record_from_json(const std::string& text) {
    try {
        const json in = json::parse(text);
        RunRecord record;
        record.id = in.at("id").get<std::string>();
        record.plan_id = in.at("plan_id").get<std::string>();
        const auto status = protocol::parse_run_status(in.at("status").get<std::string>());
        if (!status.has_value()) {
            return RunError{ErrorCategory::Storage,
                            "Unknown status in run record " + record.id,
                            "run_record_corrupt"};
        }
        record.status = status.value();
        record.env_hash = in.value("env_hash", "");
        record.seed = in.value("seed", static_cast<std::int64_t>(42));
        record.created_at_ms = in.value("created_at_ms", static_cast<std::int64_t>(0));
        record.started_at_ms = get_optional<std::int64_t>(in, "started_at_ms");
        record.completed_at_ms = get_optional<std::int64_t>(in, "completed_at_ms");
        record.duration_sec = get_optional<std::int64_t>(in, "duration_sec");
        record.error_code = get_optional<std::string>(in, "error_code");
        record.error_message = get_optional<std::string>(in, "error_message");
        return record;
    } catch (const json::exception& ex) {
        return RunError{ErrorCategory::Storage,
                        std::string("Unreadable run record: ") + ex.what(),
                        "run_record_corrupt"};
    }
}

json series_to_json(const SeriesPoint& point) {
    json out;
    out["run_id"] = point.run_id;
    out["metric"] = point.metric;
    put_optional(out, "split", point.split);
    out["step"] = point.step;
    out["value"] = point.value;
    out["ts_unix_ms"] = point.ts_unix_ms;
    return out;
}

std::vector<std::string> read_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

}  // namespace

FileRunStore::FileRunStore(std::filesystem::path root) : root_(std::move(root)) {}

Result<std::filesystem::path> FileRunStore::run_dir(const std::string& run_id) const {
    if (!is_safe_segment(run_id)) {
        return RunError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                        "invalid_run_id"};
    }
    return root_ / "runs" / run_id;
}

Result<RunRecord> FileRunStore::load_locked(const std::string& run_id) const {
    auto dir = run_dir(run_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    const auto path = core::errors::get_value(dir) / kRecordFile;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return RunError{ErrorCategory::Input, "Run ID not found: " + run_id,
                        "run_not_found"};
    }
    auto text = read_file(path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    return record_from_json(core::errors::get_value(text));
}

Result<RunRecord> FileRunStore::insert_run(const RunRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = run_dir(record.id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    const auto path = core::errors::get_value(dir) / kRecordFile;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return RunError{ErrorCategory::Storage, "Run already exists: " + record.id,
                        "run_exists"};
    }
    auto written = write_file_atomic(
        path, record_to_json(record).dump(2, ' ', false, json::error_handler_t::replace));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return record;
}

Result<RunRecord> FileRunStore::update_run(const std::string& run_id,
                                           const protocol::RunUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(run_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    RunRecord record = core::errors::get_value(loaded);

    if (update.status.has_value() && update.status.value() != record.status) {
        if (!protocol::can_transition(record.status, update.status.value())) {
            return RunError{ErrorCategory::Input,
                            "Run " + run_id + " cannot move from " +
                                protocol::to_string(record.status) + " to " +
                                protocol::to_string(update.status.value()),
                            "invalid_state_transition"};
        }
        LOG_INFO("RunStore: run " + run_id + " transition " +
                 protocol::to_string(record.status) + " -> " +
                 protocol::to_string(update.status.value()));
        record.status = update.status.value();
    }
    if (update.env_hash) record.env_hash = update.env_hash.value();
    if (update.seed) record.seed = update.seed.value();
    if (update.started_at_ms) record.started_at_ms = update.started_at_ms;
    if (update.completed_at_ms) record.completed_at_ms = update.completed_at_ms;
    if (update.duration_sec) record.duration_sec = update.duration_sec;
    if (update.error_code) record.error_code = update.error_code;
    if (update.error_message) record.error_message = update.error_message;

    const auto path = root_ / "runs" / run_id / kRecordFile;
    auto written = write_file_atomic(
        path, record_to_json(record).dump(2, ' ', false, json::error_handler_t::replace));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return record;
}

Result<RunRecord> FileRunStore::get_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(run_id);
}

Result<Ok> FileRunStore::append_event(const RunEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = run_dir(event.run_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    return append_line(core::errors::get_value(dir) / kEventsFile,
                       protocol::dump_line(protocol::to_json(event)));
}

Result<Ok> FileRunStore::append_series_point(const SeriesPoint& point) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = run_dir(point.run_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    return append_line(core::errors::get_value(dir) / kSeriesFile,
                       protocol::dump_line(series_to_json(point)));
}

Result<std::vector<RunEvent>> FileRunStore::list_events(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = run_dir(run_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    const auto path = core::errors::get_value(dir) / kEventsFile;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::vector<RunEvent>{};
    }
    auto text = read_file(path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }

    std::vector<RunEvent> events;
    try {
        for (const auto& line : read_lines(core::errors::get_value(text))) {
            const json in = json::parse(line);
            RunEvent event;
            event.run_id = in.at("run_id").get<std::string>();
            event.seq = in.at("seq").get<std::int64_t>();
            event.ts_unix_ms = in.at("ts_unix_ms").get<std::int64_t>();
            event.kind = in.at("kind").get<std::string>();
            event.payload = in.at("payload");
            events.push_back(std::move(event));
        }
    } catch (const json::exception& ex) {
        return RunError{ErrorCategory::Storage,
                        std::string("Unreadable event log for ") + run_id + ": " + ex.what(),
                        "run_record_corrupt"};
    }
    return events;
}

Result<std::vector<SeriesPoint>> FileRunStore::list_series(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = run_dir(run_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    const auto path = core::errors::get_value(dir) / kSeriesFile;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::vector<SeriesPoint>{};
    }
    auto text = read_file(path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }

    std::vector<SeriesPoint> points;
    try {
        for (const auto& line : read_lines(core::errors::get_value(text))) {
            const json in = json::parse(line);
            SeriesPoint point;
            point.run_id = in.at("run_id").get<std::string>();
            point.metric = in.at("metric").get<std::string>();
            point.split = get_optional<std::string>(in, "split");
            point.step = in.at("step").get<std::int64_t>();
            point.value = in.at("value").get<double>();
            point.ts_unix_ms = in.at("ts_unix_ms").get<std::int64_t>();
            points.push_back(std::move(point));
        }
    } catch (const json::exception& ex) {
        return RunError{ErrorCategory::Storage,
                        std::string("Unreadable series for ") + run_id + ": " + ex.what(),
                        "run_record_corrupt"};
    }
    return points;
}

}  // namespace sandrun::storage
