#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace sandrun::policy {

using core::errors::ErrorCategory;
using core::errors::FailureKind;
using core::errors::Ok;
using core::errors::RunError;

PolicyGuard::PolicyGuard(GpuPolicy gpu_policy)
    : gpu_policy_(std::move(gpu_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool PolicyGuard::requests_device(const std::string& value) const {
    const std::string lowered = lowercase(value);
    return std::find(gpu_policy_.no_device_values.begin(),
                     gpu_policy_.no_device_values.end(),
                     lowered) == gpu_policy_.no_device_values.end();
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return RunError{ErrorCategory::Input,
                        "Workspace root does not exist: " +
                            workspace_root.string(),
                        "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return RunError{ErrorCategory::Input,
                        "Workspace root is not a directory: " +
                            workspace_root.string(),
                        "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return RunError{ErrorCategory::Input,
                        "Unable to resolve workspace root: " +
                            workspace_root.string(),
                        "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return RunError{ErrorCategory::Input,
                        "Unable to resolve target path: " + target_path.string(),
                        "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return RunError{ErrorCategory::Policy,
                        "Path escapes workspace root: " +
                            canonical_candidate.string(),
                        "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<Ok> PolicyGuard::enforce_cpu_only(
    const std::map<std::string, std::string>& requested_env,
    const bool requires_gpu) const {
    if (requires_gpu) {
        return RunError{ErrorCategory::Policy,
                        "Artifact requires a GPU, but CPU-only mode is enforced",
                        "gpu_requested", "", FailureKind::GpuRequested};
    }

    for (const auto& var : gpu_policy_.device_env_vars) {
        const auto it = requested_env.find(var);
        if (it != requested_env.end() && requests_device(it->second)) {
            return RunError{ErrorCategory::Policy,
                            "GPU requested via " + var + "=" + it->second +
                                ", but CPU-only mode is enforced",
                            "gpu_requested", "", FailureKind::GpuRequested};
        }

        if (!gpu_policy_.check_host_environment) {
            continue;
        }
        const char* host_value = std::getenv(var.c_str());
        if (host_value != nullptr && requests_device(host_value)) {
            return RunError{ErrorCategory::Policy,
                            "GPU requested via host " + var + "=" + host_value +
                                ", but CPU-only mode is enforced",
                            "gpu_requested", "", FailureKind::GpuRequested};
        }
    }

    return Ok{};
}

std::map<std::string, std::string> PolicyGuard::cpu_only_environment() const {
    std::map<std::string, std::string> env;
    for (const auto& var : gpu_policy_.device_env_vars) {
        env[var] = "-1";
    }
    return env;
}

}  // namespace sandrun::policy
