#pragma once

#include "stowage/result.hpp"

#include <optional>
#include <string>

namespace stowage {

// ============================================================================
// Image References
// ============================================================================

constexpr const char* DEFAULT_DOMAIN = "docker.io";
constexpr const char* LEGACY_DEFAULT_DOMAIN = "index.docker.io";
constexpr const char* OFFICIAL_REPO_PREFIX = "library/";
constexpr const char* DEFAULT_TAG = "latest";

// A normalized image reference: <domain>/<path>[:tag][@digest]
//
// Before pinning a reference carries a tag and no digest. After pinning it
// carries a digest and no tag. Domain and path are never rewritten by
// pinning.
struct ImageReference {
    std::string domain;
    std::string path;
    std::optional<std::string> tag;
    std::optional<std::string> digest;

    // domain + "/" + path
    std::string name() const;

    // name[:tag][@digest]
    std::string to_string() const;

    // Shortest form a user would type (docker.io/library/ dropped)
    std::string familiar() const;

    // Copy with tag set to "latest" when no tag is present
    ImageReference with_tag_default() const;

    // Copy with digest set and tag cleared
    ImageReference pinned(const std::string& digest_value) const;

    bool operator==(const ImageReference& other) const {
        return domain == other.domain && path == other.path &&
               tag == other.tag && digest == other.digest;
    }
};

// Parse a reference string, normalizing familiar names:
//   nginx              -> docker.io/library/nginx
//   user/app:1.0       -> docker.io/user/app:1.0
//   localhost:5000/app -> localhost:5000/app
// Fails with REFERENCE_ERROR when the string is not a valid reference.
Result<ImageReference> parse_normalized_reference(const std::string& reference);

// Validate "<algorithm>:<encoded>". sha256 digests must carry 64 lowercase
// hex characters.
bool is_valid_digest(const std::string& digest);

// ============================================================================
// Variable Default Placeholders
// ============================================================================

// Narrow shim for descriptors that carry "${NAME-default}" or
// "${NAME:-default}" as the image value. Returns the default. Strings not
// starting with '$' are returned unchanged. Any other '$' form fails with
// REFERENCE_ERROR.
Result<std::string> expand_default_placeholder(const std::string& image);

} // namespace stowage
