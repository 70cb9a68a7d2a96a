#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace sandrun::policy {

struct GpuPolicy {
    // Device-visibility variables; any value other than a "no device" value
    // is an explicit GPU request.
    std::vector<std::string> device_env_vars = {
        "CUDA_VISIBLE_DEVICES",
        "HIP_VISIBLE_DEVICES",
        "ROCR_VISIBLE_DEVICES"};
    std::vector<std::string> no_device_values = {"", "-1", "none", "void"};
    bool check_host_environment = true;
};

class PolicyGuard {
public:
    explicit PolicyGuard(GpuPolicy gpu_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Fails with `gpu_requested` when the artifact asks for a GPU, either
    // explicitly or through a device-visibility variable in `requested_env`
    // or in the host environment.
    core::errors::Result<core::errors::Ok> enforce_cpu_only(
        const std::map<std::string, std::string>& requested_env,
        bool requires_gpu) const;

    // Variables every unit process runs with to hide all accelerators.
    std::map<std::string, std::string> cpu_only_environment() const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);
    bool requests_device(const std::string& value) const;

    GpuPolicy gpu_policy_;
};

}  // namespace sandrun::policy
