#include <chrono>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "bus/event_bus.hpp"
#include "core/config/settings.hpp"
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/run_contract.hpp"
#include "session/run_service.hpp"
#include "storage/file_blob_store.hpp"
#include "storage/file_plan_store.hpp"
#include "storage/file_run_store.hpp"

int main(int argc, char* argv[]) {
    namespace errors = sandrun::core::errors;
    using sandrun::core::logging::Logger;
    using sandrun::core::logging::LogLevel;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = sandrun::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& cmd = errors::get_value(parsed);

    // 2. Settings: config file, then SANDRUN_* overrides, then flags
    auto loaded = sandrun::core::config::load_settings(cmd.config_file);
    if (errors::is_error(loaded)) {
        const auto& err = errors::get_error(loaded);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 2;
    }
    sandrun::core::config::Settings settings = errors::get_value(loaded);
    if (cmd.storage_root.has_value()) {
        settings.storage_root = cmd.storage_root.value();
    }
    Logger::get().set_min_level(cmd.verbose ? LogLevel::DEBUG : settings.log_level);
    LOG_DEBUG("Validation mode: " + sandrun::core::config::to_string(settings.validation_mode));

    // 3. Wire the file-backed stores and the process-wide event bus
    sandrun::storage::FilePlanStore plan_store(settings.storage_root);
    sandrun::storage::FileRunStore run_store(settings.storage_root / "db");
    sandrun::storage::FileBlobStore blob_store(settings.storage_root / "blobs",
                                               settings.signing_secret);
    sandrun::bus::EventBus event_bus;

    sandrun::session::RunService service(
        sandrun::session::OrchestratorDeps{plan_store, plan_store, run_store, blob_store,
                                           event_bus},
        settings);

    auto started = service.start_run(cmd.plan_id);
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        LOG_ERROR("Failed to start run [" + err.code + "]: " + err.message);
        return 1;
    }
    const std::string run_id = errors::get_value(started);
    LOG_INFO("Run started: " + run_id);

    // 4. Stream events until the run closes its channel
    auto stream = service.stream_events(run_id);
    while (auto event = stream.next()) {
        std::cout << sandrun::bus::format_sse(event.value()) << std::flush;
    }

    auto finished = service.wait(run_id);
    if (errors::is_error(finished)) {
        const auto& err = errors::get_error(finished);
        LOG_ERROR("Failed to fetch final run state [" + err.code + "]: " + err.message);
        return 1;
    }
    const auto status = errors::get_value(finished);
    LOG_INFO("Final run state: " + sandrun::protocol::to_string(status));

    if (status != sandrun::protocol::RunStatus::Succeeded) {
        auto record = service.get_run(run_id);
        if (!errors::is_error(record)) {
            const auto& run = errors::get_value(record);
            LOG_ERROR("Run failed [" + run.error_code.value_or("unknown") + "]: " +
                      run.error_message.value_or(""));
        }
        return 1;
    }

    auto url = blob_store.create_signed_url(
        sandrun::protocol::artifact_key(run_id, sandrun::protocol::kArtifactMetrics),
        std::chrono::hours(1));
    if (errors::is_error(url)) {
        LOG_WARN("Unable to sign metrics URL: " + errors::get_error(url).message);
    } else {
        LOG_INFO("Metrics: " + errors::get_value(url).url);
    }
    return 0;
}
