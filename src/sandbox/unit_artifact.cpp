#include "sandbox/unit_artifact.hpp"

#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace sandrun::sandbox {

using core::errors::ErrorCategory;
using core::errors::FailureKind;
using core::errors::Result;
using core::errors::RunError;
using nlohmann::json;

namespace {

RunError invalid_artifact(const std::string& detail) {
    return RunError{ErrorCategory::Execution,
                    "Executable artifact is invalid: " + detail,
                    "invalid_artifact", "", FailureKind::ExecutionError};
}

// Notebook sources are either one string or a list of line strings.
bool read_source(const json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return true;
    }
    if (!value.is_array()) {
        return false;
    }
    out.clear();
    for (const auto& part : value) {
        if (!part.is_string()) {
            return false;
        }
        out += part.get<std::string>();
    }
    return true;
}

std::optional<RunError> read_settings(const json& holder, UnitArtifact& artifact) {
    const auto env = holder.find("env");
    if (env != holder.end() && !env->is_null()) {
        if (!env->is_object()) {
            return invalid_artifact("env must be an object of strings");
        }
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (!it.value().is_string()) {
                return invalid_artifact("env value for " + it.key() +
                                        " must be a string");
            }
            artifact.env[it.key()] = it.value().get<std::string>();
        }
    }

    const auto gpu = holder.find("requires_gpu");
    if (gpu != holder.end() && !gpu->is_null()) {
        if (!gpu->is_boolean()) {
            return invalid_artifact("requires_gpu must be a boolean");
        }
        artifact.requires_gpu = gpu->get<bool>();
    }
    return std::nullopt;
}

Result<UnitArtifact> parse_document(const json& doc) {
    if (!doc.is_object()) {
        return invalid_artifact("document must be a JSON object");
    }

    UnitArtifact artifact;

    if (doc.contains("units")) {
        const auto& units = doc.at("units");
        if (!units.is_array()) {
            return invalid_artifact("units must be an array");
        }
        if (auto err = read_settings(doc, artifact)) {
            return err.value();
        }
        for (std::size_t i = 0; i < units.size(); ++i) {
            const auto& unit = units[i];
            if (!unit.is_object()) {
                return invalid_artifact("unit " + std::to_string(i + 1) +
                                        " must be an object");
            }
            ExecutionUnit parsed;
            parsed.id = unit.value("id", "unit-" + std::to_string(i + 1));
            if (!unit.contains("source") || !read_source(unit.at("source"), parsed.source)) {
                return invalid_artifact("unit " + parsed.id + " has no source");
            }
            artifact.units.push_back(std::move(parsed));
        }
        return artifact;
    }

    if (doc.contains("cells")) {
        const auto& cells = doc.at("cells");
        if (!cells.is_array()) {
            return invalid_artifact("cells must be an array");
        }
        const auto metadata = doc.find("metadata");
        if (metadata != doc.end() && metadata->is_object()) {
            if (auto err = read_settings(*metadata, artifact)) {
                return err.value();
            }
        }
        std::size_t code_index = 0;
        for (const auto& cell : cells) {
            if (!cell.is_object() || cell.value("cell_type", "") != "code") {
                continue;
            }
            ++code_index;
            ExecutionUnit parsed;
            parsed.id = "cell-" + std::to_string(code_index);
            if (!cell.contains("source") || !read_source(cell.at("source"), parsed.source)) {
                return invalid_artifact(parsed.id + " has no source");
            }
            artifact.units.push_back(std::move(parsed));
        }
        return artifact;
    }

    return invalid_artifact("expected a 'units' or 'cells' array");
}

}  // namespace

Result<UnitArtifact> parse_unit_artifact(const std::string& bytes) {
    const json doc = json::parse(bytes, nullptr, false);
    if (doc.is_discarded()) {
        return invalid_artifact("not valid JSON");
    }
    try {
        return parse_document(doc);
    } catch (const json::exception& ex) {
        return invalid_artifact(ex.what());
    }
}

}  // namespace sandrun::sandbox
