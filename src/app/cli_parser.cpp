#include "cli_parser.hpp"
#include <system_error>
#include <vector>

namespace sandrun::app::cli {

    using namespace sandrun::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> plan_id;
        std::optional<std::string> root;
        std::optional<std::string> config;
        bool verbose = false;
    };

    Result<RunCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RunError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: sandrun_cli run --plan-id <id>"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return RunError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--plan-id") {
                if (i + 1 < args.size()) raw.plan_id = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --plan-id", "missing_value"};
            } else if (args[i] == "--root") {
                if (i + 1 < args.size()) raw.root = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --root", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return RunError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunCommand cmd;
        cmd.verbose = raw.verbose;

        if (!raw.plan_id.has_value() || raw.plan_id->empty()) {
            return RunError{ErrorCategory::Input, "Must provide --plan-id", "missing_required_flag"};
        }
        if (raw.plan_id->find('/') != std::string::npos || *raw.plan_id == "." || *raw.plan_id == "..") {
            return RunError{ErrorCategory::Input, "Plan ID must be a single name", "invalid_plan_id"};
        }
        cmd.plan_id = raw.plan_id.value();

        // Path validation
        if (raw.root) {
            std::filesystem::path p(raw.root.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return RunError{ErrorCategory::Input, "Storage root does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return RunError{ErrorCategory::Input, "Failed to canonicalize storage root", "invalid_path"};
            }
            cmd.storage_root = std::move(canonical_path);
        }

        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return RunError{ErrorCategory::Input, "Config file does not exist", "invalid_path"};
            }
            cmd.config_file = std::move(p);
        }

        return cmd;
    }

} // namespace sandrun::app::cli
