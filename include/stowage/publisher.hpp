#pragma once

/**
 * @file publisher.hpp
 * @brief Publish an application bundle to a registry
 *
 * serialize descriptor -> build archive -> upload blob -> push manifest.
 * Nothing is rolled back on failure: a blob uploaded before a failing
 * manifest push is left for registry-side garbage collection.
 */

#include "stowage/archive.hpp"
#include "stowage/descriptor.hpp"
#include "stowage/events.hpp"
#include "stowage/registry.hpp"
#include "stowage/result.hpp"

#include <string>

namespace stowage {

struct PublishResult {
    std::string reference;          // <domain>/<path>:<tag>
    std::string tag;
    std::string blob_digest;
    std::string manifest_digest;
    size_t archive_size = 0;
};

class BundlePublisher {
public:
    explicit BundlePublisher(RegistryClient& registry, EventSink* events = nullptr)
        : registry_(registry), events_(events) {}

    // Publish `descriptor` plus the files under options.root to `target`.
    // An untagged target is published as ":latest".
    Result<PublishResult> publish(const AppDescriptor& descriptor,
                                  const std::string& target,
                                  const BundleOptions& options = {});

private:
    RegistryClient& registry_;
    EventSink* events_;
};

} // namespace stowage
