#pragma once

#include <filesystem>
#include <string>
#include "core/errors/run_errors.hpp"

namespace sandrun::storage {

// A single path segment usable as a directory name: non-empty, no
// separators, not "." or "..".
bool is_safe_segment(const std::string& segment);

core::errors::Result<core::errors::Ok> ensure_directory(
    const std::filesystem::path& dir);

core::errors::Result<std::string> read_file(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over `path`.
core::errors::Result<core::errors::Ok> write_file_atomic(
    const std::filesystem::path& path, const std::string& contents);

core::errors::Result<core::errors::Ok> append_line(
    const std::filesystem::path& path, const std::string& line);

}  // namespace sandrun::storage
