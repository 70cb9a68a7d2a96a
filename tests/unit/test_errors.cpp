#include <gtest/gtest.h>
#include "core/errors/run_errors.hpp"

using namespace sandrun::core::errors;

// A dummy function to simulate a unit failing
Result<std::string> simulate_unit(bool should_fail) {
    if (should_fail) {
        return RunError{ErrorCategory::Execution, "Unit unit-2 failed: boom",
                        "unit_failed", "", FailureKind::ExecutionError};
    }
    return std::string("unit output");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_unit(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "unit output");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_unit(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "Unit unit-2 failed: boom");
    EXPECT_EQ(failure_of(error), FailureKind::ExecutionError);
}

TEST(ErrorModelTest, UnclassifiedErrorsAreUnexpected) {
    RunError error{ErrorCategory::Storage, "disk full"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_EQ(failure_of(error), FailureKind::UnexpectedError);
}

TEST(ErrorModelTest, FailureCodesAreStable) {
    EXPECT_EQ(to_code(FailureKind::RunTimeout), "run_timeout");
    EXPECT_EQ(to_code(FailureKind::GpuRequested), "gpu_requested");
    EXPECT_EQ(to_code(FailureKind::ExecutionError), "execution_error");
    EXPECT_EQ(to_code(FailureKind::UnexpectedError), "unexpected_error");
    EXPECT_EQ(to_code(FailureKind::PlanNotFound), "plan_not_found");
}
