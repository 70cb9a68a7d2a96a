#include "storage/file_blob_store.hpp"

#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/crypto/digest.hpp"
#include "core/logging/logger.hpp"
#include "storage/file_io.hpp"

namespace sandrun::storage {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::RunError;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

}  // namespace

FileBlobStore::FileBlobStore(std::filesystem::path root, std::string signing_secret)
    : root_(std::move(root)), signing_secret_(std::move(signing_secret)) {}

Result<std::filesystem::path> FileBlobStore::resolve(const std::string& key) const {
    if (key.empty() || key.front() == '/') {
        return RunError{ErrorCategory::Policy,
                        "Blob key must be a relative path: '" + key + "'",
                        "invalid_blob_key"};
    }
    auto created = ensure_directory(root_);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    auto checked = policy_guard_.validate_path_in_workspace(root_, key);
    if (core::errors::is_error(checked)) {
        const auto& err = core::errors::get_error(checked);
        return RunError{ErrorCategory::Policy, err.message, "invalid_blob_key", err.hint};
    }
    return core::errors::get_value(checked);
}

Result<std::string> FileBlobStore::put_text(const std::string& key,
                                            const std::string& text,
                                            const std::string& content_type) {
    auto resolved = resolve(key);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto path = core::errors::get_value(resolved);

    nlohmann::json meta;
    meta["content_type"] = content_type;
    meta["size"] = text.size();
    meta["sha256"] = core::crypto::sha256_hex(text);

    std::lock_guard<std::mutex> lock(mutex_);
    auto written = write_file_atomic(path, text);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    auto meta_written = write_file_atomic(path.string() + ".meta.json", meta.dump(2));
    if (core::errors::is_error(meta_written)) {
        return core::errors::get_error(meta_written);
    }
    LOG_DEBUG("BlobStore: wrote " + key + " (" + std::to_string(text.size()) + " bytes)");
    return key;
}

Result<bool> FileBlobStore::exists(const std::string& key) const {
    auto resolved = resolve(key);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return std::filesystem::is_regular_file(core::errors::get_value(resolved), ec);
}

Result<std::string> FileBlobStore::read_text(const std::string& key) const {
    auto resolved = resolve(key);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return read_file(core::errors::get_value(resolved));
}

std::string FileBlobStore::sign(const std::string& key,
                                const std::int64_t expires_at_ms) const {
    return core::crypto::hmac_sha256_hex(signing_secret_,
                                         key + "\n" + std::to_string(expires_at_ms));
}

Result<SignedUrl> FileBlobStore::create_signed_url(
    const std::string& key, const std::chrono::seconds expires_in) const {
    auto resolved = resolve(key);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    if (expires_in.count() <= 0) {
        return RunError{ErrorCategory::Input, "Signed URL lifetime must be positive.",
                        "invalid_expiry"};
    }

    SignedUrl url;
    url.key = key;
    url.expires_at_ms =
        now_unix_ms() +
        std::chrono::duration_cast<std::chrono::milliseconds>(expires_in).count();
    url.signature = sign(key, url.expires_at_ms);
    if (url.signature.empty()) {
        return RunError{ErrorCategory::Internal, "Unable to sign blob URL.",
                        "signing_failed"};
    }
    url.url = "file://" + core::errors::get_value(resolved).string() +
              "?expires=" + std::to_string(url.expires_at_ms) + "&sig=" + url.signature;
    return url;
}

bool FileBlobStore::verify_signed_url(const SignedUrl& url,
                                      const std::int64_t now_unix_ms) const {
    if (url.signature.empty() || now_unix_ms >= url.expires_at_ms) {
        return false;
    }
    return core::crypto::digest_equals(sign(url.key, url.expires_at_ms), url.signature);
}

}  // namespace sandrun::storage
