#include "storage/file_plan_store.hpp"

#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "storage/file_io.hpp"

namespace sandrun::storage {

using core::errors::ErrorCategory;
using core::errors::FailureKind;
using core::errors::Ok;
using core::errors::Result;
using core::errors::RunError;

namespace {

constexpr const char* kPlanFile = "plan.json";
constexpr const char* kArtifactFile = "artifact.json";

RunError plan_not_found(const std::string& plan_id) {
    return RunError{ErrorCategory::Input, "Plan not found: " + plan_id,
                    "plan_not_found", "", FailureKind::PlanNotFound};
}

}  // namespace

FilePlanStore::FilePlanStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FilePlanStore::plan_dir(const std::string& plan_id) const {
    return root_ / "plans" / plan_id;
}

Result<protocol::PlanDocument> FilePlanStore::get_plan(const std::string& plan_id) const {
    if (!is_safe_segment(plan_id)) {
        return plan_not_found(plan_id);
    }
    const auto path = plan_dir(plan_id) / kPlanFile;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return plan_not_found(plan_id);
    }

    auto text = read_file(path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    const auto doc = nlohmann::json::parse(core::errors::get_value(text), nullptr, false);
    if (doc.is_discarded()) {
        return RunError{ErrorCategory::Input, "Plan " + plan_id + " is not valid JSON",
                        "invalid_plan"};
    }
    return protocol::read_plan_document(plan_id, doc);
}

Result<std::string> FilePlanStore::download_artifact(const std::string& plan_id) const {
    if (!is_safe_segment(plan_id)) {
        return plan_not_found(plan_id);
    }
    const auto path = plan_dir(plan_id) / kArtifactFile;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return RunError{ErrorCategory::Input,
                        "No executable artifact for plan " + plan_id,
                        "artifact_not_found", "", FailureKind::ExecutionError};
    }
    return read_file(path);
}

Result<Ok> FilePlanStore::put_plan(const std::string& plan_id, const nlohmann::json& plan,
                                   const std::string& artifact) const {
    if (!is_safe_segment(plan_id)) {
        return RunError{ErrorCategory::Input, "Invalid plan ID: '" + plan_id + "'",
                        "invalid_plan_id"};
    }
    auto written = write_file_atomic(plan_dir(plan_id) / kPlanFile, plan.dump(2));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return write_file_atomic(plan_dir(plan_id) / kArtifactFile, artifact);
}

}  // namespace sandrun::storage
