#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include "core/errors/run_errors.hpp"

namespace sandrun::sandbox {

struct ProcessRequest {
    std::string script;
    std::filesystem::path working_directory = ".";
    // Applied on top of the inherited environment.
    std::map<std::string, std::string> env_overrides;
    std::uint32_t timeout_ms = 0;  // 0 disables the timeout
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs `script` with /bin/sh -c in its own process group and collects its
// output. Timeout and cancellation kill the whole group.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

}  // namespace sandrun::sandbox
