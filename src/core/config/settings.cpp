#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/run_contract.hpp"

namespace sandrun::core::config {

using errors::ErrorCategory;
using errors::Result;
using errors::RunError;
using nlohmann::json;

namespace {

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

template <typename T>
bool parse_integer(const std::string& text, T& out) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

std::optional<ValidationMode> parse_validation_mode(const std::string& text) {
    if (text == "strict") {
        return ValidationMode::Strict;
    }
    if (text == "lenient") {
        return ValidationMode::Lenient;
    }
    return std::nullopt;
}

std::optional<logging::LogLevel> parse_log_level(const std::string& text) {
    if (text == "debug") return logging::LogLevel::DEBUG;
    if (text == "info") return logging::LogLevel::INFO;
    if (text == "warn") return logging::LogLevel::WARN;
    if (text == "error") return logging::LogLevel::ERROR;
    return std::nullopt;
}

RunError invalid_setting(const std::string& key, const std::string& detail) {
    return RunError{ErrorCategory::Input,
                    "Invalid setting '" + key + "': " + detail,
                    "invalid_setting"};
}

Result<Settings> apply_json(Settings settings, const json& doc) {
    if (!doc.is_object()) {
        return RunError{ErrorCategory::Input,
                        "Config document must be a JSON object.",
                        "invalid_config"};
    }

    try {
        if (doc.contains("storage_root")) {
            settings.storage_root = doc.at("storage_root").get<std::string>();
        }
        if (doc.contains("work_root")) {
            settings.work_root = doc.at("work_root").get<std::string>();
        }
        if (doc.contains("max_logs_bytes")) {
            settings.max_logs_bytes = doc.at("max_logs_bytes").get<std::size_t>();
        }
        if (doc.contains("max_events_bytes")) {
            settings.max_events_bytes = doc.at("max_events_bytes").get<std::size_t>();
        }
        if (doc.contains("budget_floor_minutes")) {
            settings.budget_floor_minutes =
                doc.at("budget_floor_minutes").get<std::uint32_t>();
        }
        if (doc.contains("budget_ceiling_minutes")) {
            settings.budget_ceiling_minutes =
                doc.at("budget_ceiling_minutes").get<std::uint32_t>();
        }
        if (doc.contains("budget_unit_ms")) {
            settings.budget_unit_ms = doc.at("budget_unit_ms").get<std::uint32_t>();
        }
        if (doc.contains("default_seed")) {
            settings.default_seed = doc.at("default_seed").get<std::int64_t>();
        }
        if (doc.contains("drain_poll_ms")) {
            settings.drain_poll_ms = doc.at("drain_poll_ms").get<std::uint32_t>();
        }
        if (doc.contains("signing_secret")) {
            settings.signing_secret = doc.at("signing_secret").get<std::string>();
        }
        if (doc.contains("validation_mode")) {
            const auto text = doc.at("validation_mode").get<std::string>();
            const auto mode = parse_validation_mode(text);
            if (!mode.has_value()) {
                return invalid_setting("validation_mode", text);
            }
            settings.validation_mode = mode.value();
        }
        if (doc.contains("log_level")) {
            const auto text = doc.at("log_level").get<std::string>();
            const auto level = parse_log_level(text);
            if (!level.has_value()) {
                return invalid_setting("log_level", text);
            }
            settings.log_level = level.value();
        }
    } catch (const json::exception& ex) {
        return RunError{ErrorCategory::Input,
                        std::string("Config value has the wrong type: ") + ex.what(),
                        "invalid_config"};
    }
    return settings;
}

}  // namespace

std::string to_string(const ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict:
            return "strict";
        case ValidationMode::Lenient:
            return "lenient";
        default:
            return "unknown";
    }
}

Result<Settings> load_settings(
    const std::optional<std::filesystem::path>& config_file) {
    Settings settings;

    if (config_file.has_value()) {
        std::ifstream in(config_file.value());
        if (!in.is_open()) {
            return RunError{ErrorCategory::Input,
                            "Unable to open config file: " +
                                config_file->string(),
                            "config_open_failed"};
        }

        const json doc = json::parse(in, nullptr, false);
        if (doc.is_discarded()) {
            return RunError{ErrorCategory::Input,
                            "Config file is not valid JSON: " +
                                config_file->string(),
                            "invalid_config"};
        }

        auto applied = apply_json(std::move(settings), doc);
        if (errors::is_error(applied)) {
            return errors::get_error(applied);
        }
        settings = errors::get_value(applied);
    }

    auto overridden = apply_env_overrides(std::move(settings));
    if (errors::is_error(overridden)) {
        return errors::get_error(overridden);
    }
    return validate_settings(errors::get_value(overridden));
}

Result<Settings> apply_env_overrides(Settings settings) {
    if (auto value = read_env("SANDRUN_STORAGE_ROOT")) {
        settings.storage_root = value.value();
    }
    if (auto value = read_env("SANDRUN_WORK_ROOT")) {
        settings.work_root = value.value();
    }
    if (auto value = read_env("SANDRUN_MAX_LOGS_BYTES")) {
        if (!parse_integer(value.value(), settings.max_logs_bytes)) {
            return invalid_setting("SANDRUN_MAX_LOGS_BYTES", value.value());
        }
    }
    if (auto value = read_env("SANDRUN_MAX_EVENTS_BYTES")) {
        if (!parse_integer(value.value(), settings.max_events_bytes)) {
            return invalid_setting("SANDRUN_MAX_EVENTS_BYTES", value.value());
        }
    }
    if (auto value = read_env("SANDRUN_BUDGET_CEILING_MINUTES")) {
        if (!parse_integer(value.value(), settings.budget_ceiling_minutes)) {
            return invalid_setting("SANDRUN_BUDGET_CEILING_MINUTES", value.value());
        }
    }
    if (auto value = read_env("SANDRUN_BUDGET_UNIT_MS")) {
        if (!parse_integer(value.value(), settings.budget_unit_ms)) {
            return invalid_setting("SANDRUN_BUDGET_UNIT_MS", value.value());
        }
    }
    if (auto value = read_env("SANDRUN_DEFAULT_SEED")) {
        if (!parse_integer(value.value(), settings.default_seed)) {
            return invalid_setting("SANDRUN_DEFAULT_SEED", value.value());
        }
    }
    if (auto value = read_env("SANDRUN_VALIDATION_MODE")) {
        const auto mode = parse_validation_mode(value.value());
        if (!mode.has_value()) {
            return invalid_setting("SANDRUN_VALIDATION_MODE", value.value());
        }
        settings.validation_mode = mode.value();
    }
    if (auto value = read_env("SANDRUN_SIGNING_SECRET")) {
        settings.signing_secret = value.value();
    }
    if (auto value = read_env("SANDRUN_LOG_LEVEL")) {
        const auto level = parse_log_level(value.value());
        if (!level.has_value()) {
            return invalid_setting("SANDRUN_LOG_LEVEL", value.value());
        }
        settings.log_level = level.value();
    }
    return settings;
}

Result<Settings> validate_settings(const Settings& settings) {
    const std::size_t marker_size = protocol::kTruncationMarker.size();
    if (settings.max_logs_bytes < marker_size) {
        return invalid_setting("max_logs_bytes",
                               "must be at least " + std::to_string(marker_size));
    }
    if (settings.max_events_bytes < marker_size) {
        return invalid_setting("max_events_bytes",
                               "must be at least " + std::to_string(marker_size));
    }
    if (settings.budget_floor_minutes == 0 ||
        settings.budget_floor_minutes > settings.budget_ceiling_minutes) {
        return invalid_setting("budget_floor_minutes",
                               "must be between 1 and budget_ceiling_minutes");
    }
    if (settings.budget_unit_ms == 0) {
        return invalid_setting("budget_unit_ms", "must be greater than zero");
    }
    if (settings.drain_poll_ms == 0) {
        return invalid_setting("drain_poll_ms", "must be greater than zero");
    }
    if (settings.default_seed < 0) {
        return invalid_setting("default_seed", "must not be negative");
    }
    if (settings.signing_secret.empty()) {
        return invalid_setting("signing_secret", "must not be empty");
    }
    if (settings.storage_root.empty() || settings.work_root.empty()) {
        return invalid_setting("storage_root/work_root", "must not be empty");
    }
    return settings;
}

}  // namespace sandrun::core::config
