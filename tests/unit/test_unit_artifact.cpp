#include <string>
#include <gtest/gtest.h>
#include "sandbox/unit_artifact.hpp"

namespace {

using sandrun::core::errors::FailureKind;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::sandbox::parse_unit_artifact;

TEST(UnitArtifactTest, ParsesNativeUnits) {
    auto result = parse_unit_artifact(
        R"({"units":[{"id":"prep","source":"echo a"},{"source":["echo ","b"]}],
            "env":{"OMP_NUM_THREADS":"1"}})");
    ASSERT_FALSE(is_error(result));

    const auto& artifact = get_value(result);
    ASSERT_EQ(artifact.units.size(), 2u);
    EXPECT_EQ(artifact.units[0].id, "prep");
    EXPECT_EQ(artifact.units[1].id, "unit-2");
    EXPECT_EQ(artifact.units[1].source, "echo b");
    EXPECT_EQ(artifact.env.at("OMP_NUM_THREADS"), "1");
    EXPECT_FALSE(artifact.requires_gpu);
}

TEST(UnitArtifactTest, ParsesNotebookCodeCellsOnly) {
    auto result = parse_unit_artifact(
        R"({"cells":[{"cell_type":"markdown","source":"# title"},
                     {"cell_type":"code","source":["echo 1\n","echo 2\n"]},
                     {"cell_type":"code","source":"echo 3"}],
            "metadata":{"requires_gpu":true}})");
    ASSERT_FALSE(is_error(result));

    const auto& artifact = get_value(result);
    ASSERT_EQ(artifact.units.size(), 2u);
    EXPECT_EQ(artifact.units[0].id, "cell-1");
    EXPECT_EQ(artifact.units[0].source, "echo 1\necho 2\n");
    EXPECT_TRUE(artifact.requires_gpu);
}

TEST(UnitArtifactTest, RejectsMalformedDocuments) {
    for (const std::string bytes : {"not json", "[]", R"({"units":{}})",
                                    R"({"units":[{"id":"x"}]})", R"({"other":[]})",
                                    R"({"units":[],"env":{"A":1}})",
                                    R"({"units":[{"id":5,"source":"echo"}]})"}) {
        auto result = parse_unit_artifact(bytes);
        ASSERT_TRUE(is_error(result)) << bytes;
        EXPECT_EQ(get_error(result).code, "invalid_artifact") << bytes;
        EXPECT_EQ(get_error(result).failure, FailureKind::ExecutionError) << bytes;
    }
}

}  // namespace
