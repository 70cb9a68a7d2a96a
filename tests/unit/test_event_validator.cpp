#include <limits>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/event_validator.hpp"

namespace {

using nlohmann::json;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::protocol::kind_of;
using sandrun::protocol::make_raw;
using sandrun::protocol::MetricUpdateEvent;
using sandrun::protocol::parse_event;
using sandrun::protocol::PassthroughEvent;
using sandrun::protocol::ProgressEvent;
using sandrun::protocol::dump_line;
using sandrun::protocol::to_valid_utf8;
using sandrun::protocol::validate_event;

TEST(EventValidatorTest, AcceptsStageUpdate) {
    auto result = validate_event("stage_update", {{"stage", "run_start"}, {"run_id", "run-1"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"stage", "run_start"}, {"run_id", "run-1"}}));
}

TEST(EventValidatorTest, RejectsStageUpdateWithoutStage) {
    auto result = validate_event("stage_update", {{"run_id", "run-1"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_event_payload");
}

TEST(EventValidatorTest, ProgressMustBeWithinRange) {
    EXPECT_FALSE(is_error(validate_event("progress", {{"percent", 0}})));
    EXPECT_FALSE(is_error(validate_event("progress", {{"percent", 100}})));
    EXPECT_TRUE(is_error(validate_event("progress", {{"percent", 101}})));
    EXPECT_TRUE(is_error(validate_event("progress", {{"percent", -1}})));
    EXPECT_TRUE(is_error(validate_event("progress", {{"percent", "50"}})));
    EXPECT_TRUE(is_error(validate_event("progress", {{"percent", 12.5}})));
}

TEST(EventValidatorTest, IntegralFloatPercentIsNormalized) {
    auto result = validate_event("progress", {{"percent", 50.0}});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).at("percent").is_number_integer());
    EXPECT_EQ(get_value(result).at("percent").get<int>(), 50);
}

TEST(EventValidatorTest, MetricValueMustBeNumeric) {
    EXPECT_FALSE(is_error(validate_event("metric_update", {{"metric", "acc"}, {"value", 0.9}})));
    EXPECT_TRUE(is_error(validate_event("metric_update", {{"metric", "acc"}, {"value", true}})));
    EXPECT_TRUE(is_error(validate_event("metric_update", {{"metric", "acc"}, {"value", "0.9"}})));
    EXPECT_TRUE(is_error(validate_event("metric_update", {{"value", 0.9}})));
}

TEST(EventValidatorTest, DropsUndeclaredFieldsAndAbsentOptionals) {
    auto result = validate_event("metric_update",
                                 {{"metric", "loss"}, {"value", 1}, {"split", nullptr}, {"extra", 3}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"metric", "loss"}, {"value", 1.0}}));
}

TEST(EventValidatorTest, ErrorEventCarriesOptionalCode) {
    auto result = validate_event("error", {{"message", "boom"}, {"code", "execution_error"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("code"), "execution_error");
    EXPECT_TRUE(is_error(validate_event("error", {{"code", "x"}})));
}

TEST(EventValidatorTest, SamplePredFieldsAreOptional) {
    auto result = validate_event("sample_pred", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(EventValidatorTest, UnknownKindsPassThroughUntouched) {
    const json payload = {{"anything", {1, 2, 3}}};
    auto parsed = parse_event("custom_kind", payload);
    ASSERT_FALSE(is_error(parsed));
    const auto& event = get_value(parsed);
    ASSERT_TRUE(std::holds_alternative<PassthroughEvent>(event));
    EXPECT_EQ(kind_of(event), "custom_kind");

    auto validated = validate_event("custom_kind", payload);
    ASSERT_FALSE(is_error(validated));
    EXPECT_EQ(get_value(validated), payload);
}

TEST(EventValidatorTest, RejectsNonObjectPayloadForKnownKind) {
    auto result = validate_event("log_line", json::array());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_event_payload");
}

TEST(EventValidatorTest, MakeRawUsesKindAndNormalizedPayload) {
    const auto raw = make_raw(ProgressEvent{40, std::string("halfway")});
    EXPECT_EQ(raw.kind, "progress");
    EXPECT_EQ(raw.payload, json({{"percent", 40}, {"message", "halfway"}}));

    const auto metric = make_raw(MetricUpdateEvent{"acc", 0.5, std::nullopt, std::nullopt});
    EXPECT_EQ(metric.kind, "metric_update");
    EXPECT_FALSE(metric.payload.contains("split"));
}

TEST(TextEncodingTest, KeepsWellFormedUtf8) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(to_valid_utf8(text), text);
}

TEST(TextEncodingTest, ReplacesStrayAndTruncatedBytes) {
    EXPECT_EQ(to_valid_utf8("caf\xE9"), "caf\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(to_valid_utf8("\xE2\x82"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // Overlong encoding and UTF-16 surrogate are rejected.
    EXPECT_EQ(to_valid_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TextEncodingTest, DumpLineDoesNotThrowOnInvalidUtf8) {
    const json value = {{"message", std::string("caf\xE9")}};
    std::string line;
    EXPECT_NO_THROW(line = dump_line(value));
    EXPECT_EQ(line, "{\"message\":\"caf\xEF\xBF\xBD\"}");
}

}  // namespace
