#include "stowage/registry.hpp"
#include "stowage/digest.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace stowage {

using json = nlohmann::json;

namespace {

constexpr const char* DOCKER_HUB_ENDPOINT = "https://registry-1.docker.io";

const std::string& manifest_accept_header() {
    static const std::string header = std::string("Accept: ") +
        MEDIA_TYPE_OCI_INDEX + ", " +
        MEDIA_TYPE_DOCKER_MANIFEST_LIST + ", " +
        MEDIA_TYPE_OCI_MANIFEST + ", " +
        MEDIA_TYPE_DOCKER_MANIFEST;
    return header;
}

std::string base64_encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    out.resize(len > 0 ? static_cast<size_t>(len) : 0);
    return out;
}

std::string describe_failure(const HttpResponse& response) {
    if (!response.ok) {
        return response.error;
    }
    std::string message = "HTTP " + std::to_string(response.status);

    // Registry errors: {"errors":[{"code":..,"message":..}]}
    try {
        auto j = json::parse(response.body);
        if (j.contains("errors") && j["errors"].is_array() && !j["errors"].empty()) {
            const auto& first = j["errors"][0];
            if (first.contains("message") && first["message"].is_string()) {
                message += ": " + first["message"].get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Body is not a registry error document; the status is all we have
    }
    return message;
}

std::string manifests_url(const Repository& repo, const std::string& reference) {
    return repo.endpoint + "/v2/" + repo.path + "/manifests/" + reference;
}

std::string blobs_url(const Repository& repo, const std::string& digest) {
    return repo.endpoint + "/v2/" + repo.path + "/blobs/" + digest;
}

// Resolve a Location header against the registry endpoint
std::string absolute_location(const Repository& repo, const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    if (!location.empty() && location[0] == '/') {
        return repo.endpoint + location;
    }
    return repo.endpoint + "/" + location;
}

} // namespace

// ============================================================================
// Auth Challenges
// ============================================================================

int64_t parse_content_length(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](char c) { return c >= '0' && c <= '9'; })) {
        return -1;
    }
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return -1;
    }
    return static_cast<int64_t>(parsed);
}

std::map<std::string, std::string> parse_auth_challenge(const std::string& header) {
    std::map<std::string, std::string> params;

    auto space = header.find(' ');
    std::string scheme = header.substr(0, space);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    params["scheme"] = scheme;
    if (space == std::string::npos) {
        return params;
    }

    size_t i = space + 1;
    while (i < header.size()) {
        while (i < header.size() && (header[i] == ' ' || header[i] == ',')) ++i;
        auto eq = header.find('=', i);
        if (eq == std::string::npos) break;
        std::string key = header.substr(i, eq - i);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        std::string value;
        i = eq + 1;
        if (i < header.size() && header[i] == '"') {
            ++i;
            while (i < header.size() && header[i] != '"') {
                if (header[i] == '\\' && i + 1 < header.size()) ++i;
                value.push_back(header[i++]);
            }
            ++i;
        } else {
            while (i < header.size() && header[i] != ',') {
                value.push_back(header[i++]);
            }
        }
        params[key] = value;
    }
    return params;
}

std::string registry_endpoint(const std::string& domain, const ClientConfig& config) {
    if (std::find(config.insecure_registries.begin(), config.insecure_registries.end(), domain) !=
        config.insecure_registries.end()) {
        return "http://" + domain;
    }
    if (domain == DEFAULT_DOMAIN) {
        return DOCKER_HUB_ENDPOINT;
    }
    return "https://" + domain;
}

// ============================================================================
// HttpRegistryClient
// ============================================================================

HttpRegistryClient::HttpRegistryClient(ClientConfig config) : config_(std::move(config)) {}

std::string HttpRegistryClient::auth_header(const Repository& repo, bool push) const {
    auto it = tokens_.find(repo.name() + (push ? "|push" : "|pull"));
    if (it != tokens_.end()) {
        return "Authorization: Bearer " + it->second;
    }
    if (!config_.username.empty()) {
        return "Authorization: Basic " + base64_encode(config_.username + ":" + config_.password);
    }
    return "";
}

bool HttpRegistryClient::authenticate(const Repository& repo, const std::string& challenge, bool push) {
    auto params = parse_auth_challenge(challenge);
    if (params["scheme"] != "bearer") {
        // Basic challenge: credentials were already sent if we have any
        return false;
    }

    const std::string& realm = params["realm"];
    if (realm.empty()) {
        spdlog::warn("bearer challenge from {} has no realm", repo.domain);
        return false;
    }

    std::string scope = "repository:" + repo.path + (push ? ":pull,push" : ":pull");
    std::string url = realm + (realm.find('?') == std::string::npos ? "?" : "&") +
                      "scope=" + url_escape(scope);
    if (!params["service"].empty()) {
        url += "&service=" + url_escape(params["service"]);
    }

    HttpRequest request;
    request.url = url;
    request.user_agent = config_.user_agent;
    if (!config_.username.empty()) {
        request.headers.push_back("Authorization: Basic " +
                                  base64_encode(config_.username + ":" + config_.password));
    }

    spdlog::debug("requesting token for {} ({})", repo.name(), scope);
    auto response = perform_request(request);
    if (!response.success()) {
        spdlog::warn("token request for {} failed: {}", repo.name(), describe_failure(response));
        return false;
    }

    try {
        auto j = json::parse(response.body);
        std::string token;
        if (j.contains("token") && j["token"].is_string()) {
            token = j["token"].get<std::string>();
        } else if (j.contains("access_token") && j["access_token"].is_string()) {
            token = j["access_token"].get<std::string>();
        }
        if (token.empty()) {
            spdlog::warn("token response for {} carries no token", repo.name());
            return false;
        }
        tokens_[repo.name() + (push ? "|push" : "|pull")] = token;
    } catch (const json::exception& e) {
        spdlog::warn("invalid token response for {}: {}", repo.name(), e.what());
        return false;
    }
    return true;
}

HttpResponse HttpRegistryClient::send(const Repository& repo, const std::string& method,
                                      const std::string& url, std::vector<std::string> headers,
                                      const std::string& body, bool push) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.body = body;
    request.user_agent = config_.user_agent;
    request.headers = headers;

    std::string auth = auth_header(repo, push);
    if (!auth.empty()) {
        request.headers.push_back(auth);
    }

    auto response = perform_request(request);
    if (!response.ok || response.status != 401) {
        return response;
    }

    std::string challenge = response.header("www-authenticate");
    if (challenge.empty() || !authenticate(repo, challenge, push)) {
        return response;
    }

    // Retry once with the fresh token
    request.headers = std::move(headers);
    request.headers.push_back(auth_header(repo, push));
    return perform_request(request);
}

Result<Repository> HttpRegistryClient::resolve_repository(const ImageReference& ref) {
    if (ref.domain.empty() || ref.path.empty()) {
        return Result<Repository>::err(Error(ErrorCode::REFERENCE_ERROR,
            "reference has no repository: " + ref.to_string()));
    }
    Repository repo;
    repo.domain = ref.domain;
    repo.path = ref.path;
    repo.endpoint = registry_endpoint(ref.domain, config_);
    return Result<Repository>::ok(std::move(repo));
}

Result<BlobDescriptor> HttpRegistryClient::get_tag(const Repository& repo, const std::string& tag) {
    auto response = send(repo, "HEAD", manifests_url(repo, tag), {manifest_accept_header()}, "", false);
    if (!response.success()) {
        return Result<BlobDescriptor>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "failed to resolve " + repo.name() + ":" + tag + ": " + describe_failure(response)));
    }

    BlobDescriptor desc;
    desc.media_type = response.header("content-type");
    desc.digest = response.header("docker-content-digest");

    int64_t length = parse_content_length(response.header("content-length"));
    if (length >= 0) {
        desc.size = length;
    }

    if (desc.digest.empty()) {
        // Some registries omit the digest header on HEAD; fetch and hash
        auto full = send(repo, "GET", manifests_url(repo, tag), {manifest_accept_header()}, "", false);
        if (!full.success()) {
            return Result<BlobDescriptor>::err(Error(ErrorCode::RESOLUTION_ERROR,
                "failed to resolve " + repo.name() + ":" + tag + ": " + describe_failure(full)));
        }
        auto digest = content_digest(full.body);
        if (digest.isErr()) {
            return Result<BlobDescriptor>::err(
                Error(ErrorCode::RESOLUTION_ERROR, digest.error().message()));
        }
        desc.digest = digest.value();
        desc.size = static_cast<int64_t>(full.body.size());
        desc.media_type = full.header("content-type");
    }

    if (!is_valid_digest(desc.digest)) {
        return Result<BlobDescriptor>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "registry returned an invalid digest for " + repo.name() + ":" + tag));
    }
    return Result<BlobDescriptor>::ok(std::move(desc));
}

Result<ManifestPayload> HttpRegistryClient::get_manifest(const Repository& repo,
                                                         const std::string& digest) {
    auto response = send(repo, "GET", manifests_url(repo, digest), {manifest_accept_header()}, "", false);
    if (!response.success()) {
        return Result<ManifestPayload>::err(Error(ErrorCode::RESOLUTION_ERROR,
            "failed to fetch manifest " + repo.name() + "@" + digest + ": " +
            describe_failure(response)));
    }

    auto verified = verify_content_digest(response.body, digest);
    if (verified.isErr()) {
        return Result<ManifestPayload>::err(verified.error().withContext(repo.name()));
    }

    ManifestPayload payload;
    payload.media_type = response.header("content-type");
    payload.body = std::move(response.body);
    return Result<ManifestPayload>::ok(std::move(payload));
}

bool HttpRegistryClient::blob_exists(const Repository& repo, const std::string& digest) {
    auto response = send(repo, "HEAD", blobs_url(repo, digest), {}, "", true);
    return response.success();
}

Result<BlobDescriptor> HttpRegistryClient::put_blob(const Repository& repo,
                                                    const std::string& media_type,
                                                    const std::string& data) {
    auto digest = content_digest(data);
    if (digest.isErr()) {
        return Result<BlobDescriptor>::err(digest.error());
    }

    BlobDescriptor desc;
    desc.media_type = media_type;
    desc.digest = digest.value();
    desc.size = static_cast<int64_t>(data.size());

    if (blob_exists(repo, desc.digest)) {
        spdlog::debug("blob {} already present in {}", desc.digest, repo.name());
        return Result<BlobDescriptor>::ok(std::move(desc));
    }

    auto start = send(repo, "POST", repo.endpoint + "/v2/" + repo.path + "/blobs/uploads/",
                      {"Content-Length: 0"}, "", true);
    if (!start.success()) {
        return Result<BlobDescriptor>::err(Error(ErrorCode::PUBLISH_ERROR,
            "failed to start blob upload to " + repo.name() + ": " + describe_failure(start)));
    }

    std::string location = start.header("location");
    if (location.empty()) {
        return Result<BlobDescriptor>::err(Error(ErrorCode::PUBLISH_ERROR,
            "registry did not return an upload location for " + repo.name()));
    }

    std::string url = absolute_location(repo, location);
    url += (url.find('?') == std::string::npos ? "?" : "&");
    url += "digest=" + url_escape(desc.digest);

    auto finish = send(repo, "PUT", url, {"Content-Type: application/octet-stream"}, data, true);
    if (!finish.success()) {
        return Result<BlobDescriptor>::err(Error(ErrorCode::PUBLISH_ERROR,
            "failed to upload blob to " + repo.name() + ": " + describe_failure(finish)));
    }

    return Result<BlobDescriptor>::ok(std::move(desc));
}

Result<std::string> HttpRegistryClient::put_manifest(const Repository& repo,
                                                     const BuiltManifest& manifest,
                                                     const std::string& tag) {
    auto response = send(repo, "PUT", manifests_url(repo, tag),
                         {"Content-Type: " + manifest.media_type}, manifest.payload, true);
    if (!response.success()) {
        return Result<std::string>::err(Error(ErrorCode::PUBLISH_ERROR,
            "failed to push manifest " + repo.name() + ":" + tag + ": " +
            describe_failure(response)));
    }

    std::string digest = response.header("docker-content-digest");
    if (digest.empty()) {
        auto computed = content_digest(manifest.payload);
        if (computed.isErr()) {
            return Result<std::string>::err(computed.error());
        }
        digest = computed.value();
    }
    return Result<std::string>::ok(digest);
}

} // namespace stowage
