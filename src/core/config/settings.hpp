#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"

namespace sandrun::core::config {

enum class ValidationMode {
    Strict,
    Lenient
};

struct Settings {
    std::filesystem::path storage_root = ".sandrun";
    std::filesystem::path work_root =
        std::filesystem::temp_directory_path() / "sandrun-work";

    std::size_t max_logs_bytes = 2 * 1024 * 1024;
    std::size_t max_events_bytes = 5 * 1024 * 1024;

    // Deadline = clamp(budget_minutes, floor, ceiling) * budget_unit_ms.
    std::uint32_t budget_floor_minutes = 1;
    std::uint32_t budget_ceiling_minutes = 25;
    std::uint32_t budget_unit_ms = 60 * 1000;

    std::int64_t default_seed = 42;
    ValidationMode validation_mode = ValidationMode::Lenient;
    std::string signing_secret = "sandrun-dev-signing-secret";
    logging::LogLevel log_level = logging::LogLevel::INFO;

    // Upper bound on one wait for sandbox events before re-checking the
    // worker and the deadline.
    std::uint32_t drain_poll_ms = 50;
};

// Reads `config_file` (JSON) when given, applies SANDRUN_* environment
// overrides and validates the result.
errors::Result<Settings> load_settings(
    const std::optional<std::filesystem::path>& config_file = std::nullopt);

errors::Result<Settings> apply_env_overrides(Settings settings);

errors::Result<Settings> validate_settings(const Settings& settings);

std::string to_string(ValidationMode mode);

}  // namespace sandrun::core::config
