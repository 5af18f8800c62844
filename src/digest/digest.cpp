#include "stowage/digest.hpp"

#include <openssl/evp.h>

namespace stowage {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

HashResult sha256_bytes(const void* data, size_t size) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

Result<std::string> to_content_digest(const HashResult& hash) {
    if (!hash.ok) {
        return Result<std::string>::err(Error(ErrorCode::PUBLISH_ERROR, hash.error));
    }
    return Result<std::string>::ok("sha256:" + hash.hex_digest);
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    return sha256_bytes(data.data(), data.size());
}

HashResult compute_sha256(const std::string& data) {
    return sha256_bytes(data.data(), data.size());
}

Result<std::string> content_digest(const std::vector<uint8_t>& data) {
    return to_content_digest(compute_sha256(data));
}

Result<std::string> content_digest(const std::string& data) {
    return to_content_digest(compute_sha256(data));
}

Status verify_content_digest(const std::string& data, const std::string& expected) {
    if (expected.rfind("sha256:", 0) != 0) {
        return Status::ok();
    }

    auto hash = compute_sha256(data);
    if (!hash.ok) {
        return Status::err(Error(ErrorCode::RESOLUTION_ERROR, hash.error));
    }

    std::string actual = "sha256:" + hash.hex_digest;
    if (actual != expected) {
        return Status::err(Error(ErrorCode::RESOLUTION_ERROR,
            "content digest mismatch: expected " + expected + ", got " + actual));
    }
    return Status::ok();
}

} // namespace stowage
