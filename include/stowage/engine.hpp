#pragma once

/**
 * @file engine.hpp
 * @brief Local container engine collaborator (distribution inspection)
 */

#include "stowage/manifest.hpp"
#include "stowage/reference.hpp"
#include "stowage/result.hpp"

#include <string>
#include <vector>

namespace stowage {

constexpr const char* DEFAULT_ENGINE_SOCKET = "/var/run/docker.sock";
constexpr const char* DEFAULT_ENGINE_API_VERSION = "v1.40";

struct EngineConfig {
    std::string socket_path = DEFAULT_ENGINE_SOCKET;
    std::string api_version = DEFAULT_ENGINE_API_VERSION;
};

// What the engine reports about a reference in its registry
struct DistributionInspection {
    std::string digest;
    std::vector<PlatformDescriptor> platforms;
};

class EngineClient {
public:
    virtual ~EngineClient() = default;

    virtual Result<DistributionInspection> inspect_distribution(const ImageReference& ref) = 0;
};

// Talks to the engine API over its unix socket
class DockerEngineClient : public EngineClient {
public:
    explicit DockerEngineClient(EngineConfig config = {});

    Result<DistributionInspection> inspect_distribution(const ImageReference& ref) override;

private:
    EngineConfig config_;
};

// Decode the engine's /distribution/<ref>/json response body
Result<DistributionInspection> parse_distribution_inspection(const std::string& body);

} // namespace stowage
