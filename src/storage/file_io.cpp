#include "storage/file_io.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace sandrun::storage {

using core::errors::ErrorCategory;
using core::errors::Ok;
using core::errors::Result;
using core::errors::RunError;

bool is_safe_segment(const std::string& segment) {
    if (segment.empty() || segment == "." || segment == "..") {
        return false;
    }
    return segment.find('/') == std::string::npos &&
           segment.find('\\') == std::string::npos &&
           segment.find('\0') == std::string::npos;
}

Result<Ok> ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return RunError{ErrorCategory::Storage,
                        "Unable to create directory: " + dir.string() + " (" +
                            ec.message() + ")",
                        "storage_dir_create_failed"};
    }
    return Ok{};
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return RunError{ErrorCategory::Storage, "No such file: " + path.string(),
                        "storage_not_found"};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return RunError{ErrorCategory::Storage,
                        "Unable to open file: " + path.string(),
                        "storage_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Result<Ok> write_file_atomic(const std::filesystem::path& path,
                             const std::string& contents) {
    auto dir = ensure_directory(path.parent_path());
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    const auto tmp_path = path.string() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return RunError{ErrorCategory::Storage,
                            "Unable to open file: " + tmp_path,
                            "storage_open_failed"};
        }
        out << contents;
        out.flush();
        if (!out.good()) {
            return RunError{ErrorCategory::Storage,
                            "Unable to write file: " + tmp_path,
                            "storage_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return RunError{ErrorCategory::Storage,
                        "Unable to replace file: " + path.string(),
                        "storage_write_failed"};
    }
    return Ok{};
}

Result<Ok> append_line(const std::filesystem::path& path, const std::string& line) {
    auto dir = ensure_directory(path.parent_path());
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return RunError{ErrorCategory::Storage,
                        "Unable to open file: " + path.string(),
                        "storage_open_failed"};
    }

    out << line << "\n";
    if (!out.good()) {
        return RunError{ErrorCategory::Storage,
                        "Unable to append to file: " + path.string(),
                        "storage_write_failed"};
    }
    return Ok{};
}

}  // namespace sandrun::storage
