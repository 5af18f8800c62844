#pragma once

/**
 * @file manifest.hpp
 * @brief Registry manifest model
 *
 * A manifest fetched from a registry is either a single-platform image
 * manifest or a platform list (docker manifest list / OCI index). Both
 * expose the same platform enumeration.
 */

#include "stowage/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stowage {

// ============================================================================
// Media Types
// ============================================================================

constexpr const char* MEDIA_TYPE_DOCKER_MANIFEST =
    "application/vnd.docker.distribution.manifest.v2+json";
constexpr const char* MEDIA_TYPE_DOCKER_MANIFEST_LIST =
    "application/vnd.docker.distribution.manifest.list.v2+json";
constexpr const char* MEDIA_TYPE_OCI_MANIFEST =
    "application/vnd.oci.image.manifest.v1+json";
constexpr const char* MEDIA_TYPE_OCI_INDEX =
    "application/vnd.oci.image.index.v1+json";
constexpr const char* MEDIA_TYPE_OCI_CONFIG =
    "application/vnd.oci.image.config.v1+json";

// Bundle blob and its manifest annotation
constexpr const char* MEDIA_TYPE_BUNDLE = "application/tar+gzip";
constexpr const char* BUNDLE_KIND = "compose-app";
constexpr const char* BUNDLE_VERSION = "v1";

// ============================================================================
// Descriptors
// ============================================================================

struct PlatformDescriptor {
    std::string architecture;
    std::string os;
    std::string variant;
};

// Content descriptor: what a manifest says about a blob or sub-manifest
struct BlobDescriptor {
    std::string media_type;
    std::string digest;
    int64_t size = 0;
    std::map<std::string, std::string> annotations;
    std::optional<PlatformDescriptor> platform;
};

// ============================================================================
// Manifest Variant
// ============================================================================

struct SinglePlatformManifest {
    BlobDescriptor config;
    std::vector<BlobDescriptor> layers;
};

struct PlatformListManifest {
    std::vector<BlobDescriptor> entries;
};

class Manifest {
public:
    using Content = std::variant<SinglePlatformManifest, PlatformListManifest>;

    Manifest(std::string media_type, Content content)
        : media_type_(std::move(media_type)), content_(std::move(content)) {}

    const std::string& media_type() const { return media_type_; }
    const Content& content() const { return content_; }

    bool is_platform_list() const {
        return std::holds_alternative<PlatformListManifest>(content_);
    }

    // Platforms in manifest order. Empty for a single-platform manifest.
    std::vector<PlatformDescriptor> platforms() const;

private:
    std::string media_type_;
    Content content_;
};

// Raw manifest as returned by a registry
struct ManifestPayload {
    std::string media_type;     // Content-Type, may be empty
    std::string body;
};

// Decode a docker schema2 manifest, docker manifest list, OCI manifest or
// OCI index. Anything else fails with RESOLUTION_ERROR.
Result<Manifest> parse_manifest(const ManifestPayload& payload);

// ============================================================================
// Bundle Manifest
// ============================================================================

// A manifest ready to push, together with the config blob it references
struct BuiltManifest {
    std::string media_type;
    std::string payload;            // Serialized manifest JSON
    BlobDescriptor config;
    std::string config_data;        // Bytes of the config blob
};

// Single-layer OCI image manifest referencing `layer`, with an empty config
// blob and the given manifest annotations.
Result<BuiltManifest> build_bundle_manifest(const BlobDescriptor& layer,
                                            const std::map<std::string, std::string>& annotations);

} // namespace stowage
