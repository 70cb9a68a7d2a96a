#pragma once

#include <string>

namespace sandrun::core::crypto {

// Lowercase hex SHA-256 of `input`.
std::string sha256_hex(const std::string& input);

// Lowercase hex HMAC-SHA256 of `data` keyed by `key`.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Constant-time comparison for signature checks.
bool digest_equals(const std::string& lhs, const std::string& rhs);

}  // namespace sandrun::core::crypto
