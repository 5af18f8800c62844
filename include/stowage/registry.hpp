#pragma once

/**
 * @file registry.hpp
 * @brief Registry collaborator: repository resolution, tags, manifests, blobs
 *
 * RegistryClient is the seam the pinner and publisher depend on.
 * HttpRegistryClient speaks the registry HTTP API v2 over libcurl.
 */

#include "stowage/http.hpp"
#include "stowage/manifest.hpp"
#include "stowage/reference.hpp"
#include "stowage/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stowage {

// ============================================================================
// Configuration
// ============================================================================

struct ClientConfig {
    // Domains contacted over plain HTTP instead of HTTPS
    std::vector<std::string> insecure_registries;

    // Optional credentials, used for basic auth and token requests
    std::string username;
    std::string password;

    std::string user_agent = "stowage/1.0";
};

// ============================================================================
// Registry Client
// ============================================================================

// A resolved repository: where to talk to and under which name
struct Repository {
    std::string domain;     // As written in the reference (docker.io, ...)
    std::string path;       // library/nginx
    std::string endpoint;   // https://registry-1.docker.io

    std::string name() const { return domain + "/" + path; }
};

class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    virtual Result<Repository> resolve_repository(const ImageReference& ref) = 0;

    // Descriptor the tag currently points at
    virtual Result<BlobDescriptor> get_tag(const Repository& repo, const std::string& tag) = 0;

    virtual Result<ManifestPayload> get_manifest(const Repository& repo,
                                                 const std::string& digest) = 0;

    // Upload an opaque blob; returns its descriptor (digest, size, media type)
    virtual Result<BlobDescriptor> put_blob(const Repository& repo,
                                            const std::string& media_type,
                                            const std::string& data) = 0;

    // Push a manifest under a tag; returns the manifest digest
    virtual Result<std::string> put_manifest(const Repository& repo,
                                             const BuiltManifest& manifest,
                                             const std::string& tag) = 0;
};

// ============================================================================
// HTTP Registry Client
// ============================================================================

class HttpRegistryClient : public RegistryClient {
public:
    explicit HttpRegistryClient(ClientConfig config = {});

    Result<Repository> resolve_repository(const ImageReference& ref) override;
    Result<BlobDescriptor> get_tag(const Repository& repo, const std::string& tag) override;
    Result<ManifestPayload> get_manifest(const Repository& repo,
                                         const std::string& digest) override;
    Result<BlobDescriptor> put_blob(const Repository& repo,
                                    const std::string& media_type,
                                    const std::string& data) override;
    Result<std::string> put_manifest(const Repository& repo,
                                     const BuiltManifest& manifest,
                                     const std::string& tag) override;

private:
    HttpResponse send(const Repository& repo, const std::string& method, const std::string& url,
                      std::vector<std::string> headers, const std::string& body, bool push);
    bool authenticate(const Repository& repo, const std::string& challenge, bool push);
    std::string auth_header(const Repository& repo, bool push) const;
    bool blob_exists(const Repository& repo, const std::string& digest);

    ClientConfig config_;
    std::map<std::string, std::string> tokens_;   // "<repo>|pull" / "<repo>|push"
};

// Parse a "Bearer realm=..,service=..,scope=.." challenge into its params
std::map<std::string, std::string> parse_auth_challenge(const std::string& header);

// Content-Length header value; -1 when absent, malformed or out of range
int64_t parse_content_length(const std::string& value);

// Endpoint URL for a registry domain
std::string registry_endpoint(const std::string& domain, const ClientConfig& config);

} // namespace stowage
