#include "protocol/plan_contract.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include "core/crypto/digest.hpp"

namespace sandrun::protocol {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;

namespace {

RunError invalid_plan(const std::string& plan_id, const std::string& detail) {
    return RunError{ErrorCategory::Input,
                    "Plan " + plan_id + " is invalid: " + detail,
                    "invalid_plan"};
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

}  // namespace

Result<PlanDocument> read_plan_document(const std::string& plan_id,
                                        const json& doc) {
    if (!doc.is_object()) {
        return invalid_plan(plan_id, "document must be a JSON object");
    }

    PlanDocument plan;
    plan.plan_id = plan_id;
    plan.raw = doc;

    const auto policy = doc.find("policy");
    if (policy != doc.end() && policy->is_object()) {
        const auto budget = policy->find("budget_minutes");
        if (budget != policy->end() && !budget->is_null()) {
            if (!budget->is_number_integer() ||
                (!budget->is_number_unsigned() && budget->get<std::int64_t>() < 0)) {
                return invalid_plan(plan_id,
                                    "policy.budget_minutes must be a non-negative integer");
            }
            // Saturate so oversized budgets clamp to the ceiling instead of wrapping.
            const auto minutes = budget->get<std::uint64_t>();
            plan.budget_minutes = static_cast<std::uint32_t>(std::min<std::uint64_t>(
                minutes, std::numeric_limits<std::uint32_t>::max()));
        }
    }

    const auto config = doc.find("config");
    if (config != doc.end() && config->is_object()) {
        const auto seed = config->find("seed");
        if (seed != config->end() && !seed->is_null()) {
            if (!seed->is_number_integer() || seed->get<std::int64_t>() < 0) {
                return invalid_plan(plan_id, "config.seed must be a non-negative integer");
            }
            plan.seed = seed->get<std::int64_t>();
        }
    }

    const auto requirements = doc.find("requirements");
    if (requirements != doc.end() && !requirements->is_null()) {
        if (!requirements->is_array()) {
            return invalid_plan(plan_id, "requirements must be an array of strings");
        }
        std::set<std::string> unique;
        for (const auto& item : *requirements) {
            if (!item.is_string()) {
                return invalid_plan(plan_id, "requirements must be an array of strings");
            }
            const auto line = item.get<std::string>();
            if (!line.empty()) {
                unique.insert(line);
            }
        }
        plan.requirements.assign(unique.begin(), unique.end());
    }

    return plan;
}

std::string requirements_text(const PlanDocument& plan) {
    if (plan.requirements.empty()) {
        return "";
    }
    return join_lines(plan.requirements) + "\n";
}

std::string compute_env_hash(const PlanDocument& plan) {
    return core::crypto::sha256_hex(join_lines(plan.requirements));
}

}  // namespace sandrun::protocol
