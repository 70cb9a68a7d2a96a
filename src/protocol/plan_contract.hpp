#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"

namespace sandrun::protocol {

// The parts of a validated plan document this service reads.
struct PlanDocument {
    std::string plan_id;
    std::optional<std::uint32_t> budget_minutes;  // policy.budget_minutes
    std::optional<std::int64_t> seed;             // config.seed
    std::vector<std::string> requirements;        // sorted, deduplicated
    nlohmann::json raw = nlohmann::json::object();
};

// Extracts the plan fields from `doc`. Fails with `invalid_plan` when a
// field is present with the wrong type.
core::errors::Result<PlanDocument> read_plan_document(const std::string& plan_id,
                                                      const nlohmann::json& doc);

// requirements.txt body: one requirement per line, newline-terminated.
std::string requirements_text(const PlanDocument& plan);

// Content hash of the resolved environment (SHA-256 of the sorted
// requirement lines).
std::string compute_env_hash(const PlanDocument& plan);

}  // namespace sandrun::protocol
