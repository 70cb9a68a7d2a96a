#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/run_errors.hpp"

namespace sandrun::app::cli {

    struct RunCommand {
        std::string plan_id;
        std::optional<std::filesystem::path> storage_root;
        std::optional<std::filesystem::path> config_file;
        bool verbose = false;
    };

    sandrun::core::errors::Result<RunCommand> parse_and_validate(int argc, char* argv[]);
}
