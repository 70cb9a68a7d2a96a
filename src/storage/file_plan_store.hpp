#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "storage/plan_store.hpp"

namespace sandrun::storage {

// Plans laid out as <root>/plans/<plan_id>/plan.json with the generated
// artifact beside it in artifact.json.
class FilePlanStore : public PlanResolver, public ArtifactSource {
public:
    explicit FilePlanStore(std::filesystem::path root);

    core::errors::Result<protocol::PlanDocument> get_plan(
        const std::string& plan_id) const override;
    core::errors::Result<std::string> download_artifact(
        const std::string& plan_id) const override;

    // Registers a plan and its artifact; used by drivers and tests.
    core::errors::Result<core::errors::Ok> put_plan(const std::string& plan_id,
                                                    const nlohmann::json& plan,
                                                    const std::string& artifact) const;

private:
    std::filesystem::path plan_dir(const std::string& plan_id) const;

    std::filesystem::path root_;
};

}  // namespace sandrun::storage
