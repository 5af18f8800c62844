#pragma once

#include "stowage/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stowage {

// ============================================================================
// Content Digests (SHA-256 via OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256(const std::string& data);

// "sha256:<hex>" for a payload. Fails only if the hash backend fails.
Result<std::string> content_digest(const std::vector<uint8_t>& data);
Result<std::string> content_digest(const std::string& data);

// Check a payload against "sha256:<hex>". Digests with other algorithms
// cannot be verified locally and are accepted.
Status verify_content_digest(const std::string& data, const std::string& expected);

} // namespace stowage
