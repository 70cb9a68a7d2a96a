#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "core/errors/run_errors.hpp"

namespace sandrun::storage {

struct SignedUrl {
    std::string key;
    std::string url;
    std::int64_t expires_at_ms = 0;
    std::string signature;
};

// Write-through artifact storage addressed by slash-separated keys.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual core::errors::Result<std::string> put_text(
        const std::string& key, const std::string& text,
        const std::string& content_type) = 0;

    virtual core::errors::Result<bool> exists(const std::string& key) const = 0;

    virtual core::errors::Result<std::string> read_text(
        const std::string& key) const = 0;

    // Time-limited read access to `key`.
    virtual core::errors::Result<SignedUrl> create_signed_url(
        const std::string& key, std::chrono::seconds expires_in) const = 0;
};

}  // namespace sandrun::storage
