#include <cstdlib>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/config/settings.hpp"
#include "test_support.hpp"

namespace {

using sandrun::core::config::apply_env_overrides;
using sandrun::core::config::load_settings;
using sandrun::core::config::Settings;
using sandrun::core::config::validate_settings;
using sandrun::core::config::ValidationMode;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::testing::TempWorkspace;
using sandrun::testing::write_file;

// Sets an environment variable for the lifetime of the scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

TEST(SettingsTest, DefaultsMatchOperationalLimits) {
    auto result = load_settings();
    ASSERT_FALSE(is_error(result));

    const auto& settings = get_value(result);
    EXPECT_EQ(settings.max_logs_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(settings.max_events_bytes, 5u * 1024 * 1024);
    EXPECT_EQ(settings.budget_floor_minutes, 1u);
    EXPECT_EQ(settings.budget_ceiling_minutes, 25u);
    EXPECT_EQ(settings.budget_unit_ms, 60000u);
    EXPECT_EQ(settings.default_seed, 42);
    EXPECT_EQ(settings.validation_mode, ValidationMode::Lenient);
}

TEST(SettingsTest, ReadsConfigFile) {
    TempWorkspace workspace("settings");
    const auto path = workspace.root() / "sandrun.json";
    write_file(path, R"({"max_logs_bytes": 4096, "budget_unit_ms": 100,
                         "validation_mode": "strict", "log_level": "debug"})");

    auto result = load_settings(path);
    ASSERT_FALSE(is_error(result));

    const auto& settings = get_value(result);
    EXPECT_EQ(settings.max_logs_bytes, 4096u);
    EXPECT_EQ(settings.budget_unit_ms, 100u);
    EXPECT_EQ(settings.validation_mode, ValidationMode::Strict);
}

TEST(SettingsTest, RejectsWrongTypeInConfig) {
    TempWorkspace workspace("settings");
    const auto path = workspace.root() / "sandrun.json";
    write_file(path, R"({"max_logs_bytes": "big"})");

    auto result = load_settings(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(SettingsTest, RejectsMalformedConfig) {
    TempWorkspace workspace("settings");
    const auto path = workspace.root() / "sandrun.json";
    write_file(path, "{not json");

    auto result = load_settings(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(SettingsTest, EnvironmentOverridesApply) {
    ScopedEnv seed("SANDRUN_DEFAULT_SEED", "7");
    ScopedEnv mode("SANDRUN_VALIDATION_MODE", "strict");

    auto result = apply_env_overrides(Settings{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).default_seed, 7);
    EXPECT_EQ(get_value(result).validation_mode, ValidationMode::Strict);
}

TEST(SettingsTest, RejectsNonNumericOverride) {
    ScopedEnv logs("SANDRUN_MAX_LOGS_BYTES", "12kb");

    auto result = apply_env_overrides(Settings{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_setting");
}

TEST(SettingsTest, RejectsCapSmallerThanMarker) {
    Settings settings;
    settings.max_logs_bytes = 4;
    auto result = validate_settings(settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_setting");
}

TEST(SettingsTest, AcceptsTenByteCap) {
    Settings settings;
    settings.max_logs_bytes = 10;
    EXPECT_FALSE(is_error(validate_settings(settings)));
}

TEST(SettingsTest, RejectsFloorAboveCeiling) {
    Settings settings;
    settings.budget_floor_minutes = 30;
    EXPECT_TRUE(is_error(validate_settings(settings)));
}

TEST(RunIdTest, GeneratesPrefixedHexIds) {
    const auto id = sandrun::core::config::generate_run_id();
    ASSERT_EQ(id.size(), 16u);
    EXPECT_EQ(id.rfind("run-", 0), 0u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 4), std::string::npos);
    EXPECT_EQ(sandrun::core::config::random_hex(6).size(), 6u);
    EXPECT_NE(sandrun::core::config::generate_run_id(), id);
}

}  // namespace
