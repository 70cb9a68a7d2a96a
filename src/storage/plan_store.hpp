#pragma once

#include <string>
#include "core/errors/run_errors.hpp"
#include "protocol/plan_contract.hpp"

namespace sandrun::storage {

// Resolves a plan id to its validated plan document. Fails with
// `plan_not_found` when the plan does not exist.
class PlanResolver {
public:
    virtual ~PlanResolver() = default;
    virtual core::errors::Result<protocol::PlanDocument> get_plan(
        const std::string& plan_id) const = 0;
};

// The pre-generated executable artifact for a plan.
class ArtifactSource {
public:
    virtual ~ArtifactSource() = default;
    virtual core::errors::Result<std::string> download_artifact(
        const std::string& plan_id) const = 0;
};

}  // namespace sandrun::storage
