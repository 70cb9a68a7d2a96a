#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace sandrun::sandbox {

struct ExecutionUnit {
    std::string id;
    std::string source;  // POSIX shell script
};

struct UnitArtifact {
    std::vector<ExecutionUnit> units;
    std::map<std::string, std::string> env;
    bool requires_gpu = false;
};

// Accepts the native `{"units": [...]}` shape and the notebook
// `{"cells": [...]}` shape; markdown and raw cells are skipped. Fails with
// `invalid_artifact` (an execution error) on anything else.
core::errors::Result<UnitArtifact> parse_unit_artifact(const std::string& bytes);

}  // namespace sandrun::sandbox
