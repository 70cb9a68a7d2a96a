#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include "policy/policy_guard.hpp"
#include "storage/blob_store.hpp"

namespace sandrun::storage {

// Blobs as files under <root>/<key>, with a <key>.meta.json sidecar
// recording content type, size and SHA-256.
class FileBlobStore : public BlobStore {
public:
    FileBlobStore(std::filesystem::path root, std::string signing_secret);

    core::errors::Result<std::string> put_text(const std::string& key,
                                               const std::string& text,
                                               const std::string& content_type) override;
    core::errors::Result<bool> exists(const std::string& key) const override;
    core::errors::Result<std::string> read_text(const std::string& key) const override;
    core::errors::Result<SignedUrl> create_signed_url(
        const std::string& key, std::chrono::seconds expires_in) const override;

    // True when `url` was issued by this store and has not expired at
    // `now_unix_ms`.
    bool verify_signed_url(const SignedUrl& url, std::int64_t now_unix_ms) const;

private:
    core::errors::Result<std::filesystem::path> resolve(const std::string& key) const;
    std::string sign(const std::string& key, std::int64_t expires_at_ms) const;

    std::filesystem::path root_;
    std::string signing_secret_;
    policy::PolicyGuard policy_guard_;
    mutable std::mutex mutex_;
};

}  // namespace sandrun::storage
