#pragma once

/**
 * @file pinner.hpp
 * @brief Pin every service image of a descriptor to an immutable digest
 *
 * Pinning replaces "<domain>/<path>:<tag>" with "<domain>/<path>@<digest>".
 * Two interchangeable strategies resolve the digest: asking the local
 * engine, or walking tag -> manifest in the registry.
 *
 * Pinning is best-effort and not atomic: it stops at the first failing
 * service, and services pinned before it keep their new value.
 */

#include "stowage/descriptor.hpp"
#include "stowage/engine.hpp"
#include "stowage/events.hpp"
#include "stowage/manifest.hpp"
#include "stowage/reference.hpp"
#include "stowage/registry.hpp"
#include "stowage/result.hpp"

#include <string>
#include <vector>

namespace stowage {

// ============================================================================
// Digest Resolution
// ============================================================================

struct Resolution {
    std::string digest;
    std::vector<PlatformDescriptor> platforms;  // Empty for single-platform images
};

class DigestResolver {
public:
    virtual ~DigestResolver() = default;

    // `ref` carries a tag and no digest
    virtual Result<Resolution> resolve(const ImageReference& ref) = 0;
};

// Asks the local engine to inspect the reference in its registry
class EngineDigestResolver : public DigestResolver {
public:
    explicit EngineDigestResolver(EngineClient& engine) : engine_(engine) {}

    Result<Resolution> resolve(const ImageReference& ref) override;

private:
    EngineClient& engine_;
};

// Resolves tag -> descriptor -> manifest through the registry
class RegistryDigestResolver : public DigestResolver {
public:
    explicit RegistryDigestResolver(RegistryClient& registry) : registry_(registry) {}

    Result<Resolution> resolve(const ImageReference& ref) override;

private:
    RegistryClient& registry_;
};

// ============================================================================
// Reference Pinner
// ============================================================================

class ReferencePinner {
public:
    explicit ReferencePinner(DigestResolver& resolver, EventSink* events = nullptr)
        : resolver_(resolver), events_(events) {}

    // Pin every service in name order. Emits service_pinning before and
    // service_pinned after each service.
    Status pin_images(AppDescriptor& descriptor);

    // Resolve a single image string to its pinned reference
    Result<ImageReference> pin_image(const std::string& image, Resolution* resolution = nullptr);

private:
    DigestResolver& resolver_;
    EventSink* events_;
};

// "amd64, arm64, armv7": architectures comma-joined, arm variants appended
std::string format_platforms(const std::vector<PlatformDescriptor>& platforms);

} // namespace stowage
