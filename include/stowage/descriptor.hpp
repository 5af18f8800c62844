#pragma once

/**
 * @file descriptor.hpp
 * @brief Multi-service application descriptor (docker-compose.yml)
 *
 * The descriptor is validated once, when it is loaded. Every service is a
 * typed record with a string image; everything else in the document is
 * carried opaquely and re-emitted unchanged.
 */

#include "stowage/result.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <vector>

namespace stowage {

constexpr const char* DESCRIPTOR_FILENAME = "docker-compose.yml";

// ============================================================================
// Service Descriptor
// ============================================================================

struct ServiceDescriptor {
    std::string name;
    std::string image;
    YAML::Node extra;   // All other service fields, in document order
};

// ============================================================================
// Application Descriptor
// ============================================================================

class AppDescriptor {
public:
    AppDescriptor();

    // Parse descriptor text. `source` names the input in error messages.
    static Result<AppDescriptor> parse(const std::string& text,
                                       const std::string& source = "<input>");

    // Read and parse a descriptor file
    static Result<AppDescriptor> load(const std::string& path);

    // Services keyed by name; iteration order is name order
    const std::map<std::string, ServiceDescriptor>& services() const { return services_; }

    bool has_service(const std::string& name) const;
    const ServiceDescriptor* find_service(const std::string& name) const;

    // Add or replace a service. Used by callers that build a descriptor
    // programmatically.
    void add_service(const std::string& name, const std::string& image);

    // Replace the image of an existing service. Fails with INPUT_ERROR if no
    // service has that name.
    Status set_image(const std::string& name, const std::string& image);

    // Canonical YAML text: top-level keys in document order, services in
    // name order, "image" first within each service.
    Result<std::string> serialize() const;

private:
    YAML::Node document_;   // Top-level mapping without "services"
    std::vector<std::string> top_level_order_;
    std::map<std::string, ServiceDescriptor> services_;
};

} // namespace stowage
