#include "stowage/manifest.hpp"
#include "stowage/digest.hpp"

#include <nlohmann/json.hpp>

namespace stowage {

using json = nlohmann::json;

// ============================================================================
// JSON Helpers
// ============================================================================

namespace {

std::string get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

Error unexpected_manifest(const std::string& why) {
    return Error(ErrorCode::RESOLUTION_ERROR, "unexpected manifest: " + why);
}

Result<BlobDescriptor> parse_descriptor(const json& j) {
    if (!j.is_object()) {
        return Result<BlobDescriptor>::err(unexpected_manifest("descriptor is not an object"));
    }

    BlobDescriptor desc;
    desc.media_type = get_string(j, "mediaType");
    desc.digest = get_string(j, "digest");
    if (desc.digest.empty()) {
        return Result<BlobDescriptor>::err(unexpected_manifest("descriptor without digest"));
    }
    if (j.contains("size") && j["size"].is_number_integer()) {
        desc.size = j["size"].get<int64_t>();
    }

    if (j.contains("annotations") && j["annotations"].is_object()) {
        for (auto& [key, val] : j["annotations"].items()) {
            if (val.is_string()) {
                desc.annotations[key] = val.get<std::string>();
            }
        }
    }

    if (j.contains("platform") && j["platform"].is_object()) {
        const auto& p = j["platform"];
        PlatformDescriptor platform;
        platform.architecture = get_string(p, "architecture");
        platform.os = get_string(p, "os");
        platform.variant = get_string(p, "variant");
        desc.platform = platform;
    }

    return Result<BlobDescriptor>::ok(std::move(desc));
}

json descriptor_to_json(const BlobDescriptor& desc) {
    json j;
    j["mediaType"] = desc.media_type;
    j["digest"] = desc.digest;
    j["size"] = desc.size;
    if (!desc.annotations.empty()) {
        j["annotations"] = desc.annotations;
    }
    return j;
}

// Media type when the registry did not send a usable Content-Type
std::string sniff_media_type(const json& j) {
    std::string media_type = get_string(j, "mediaType");
    if (!media_type.empty()) {
        return media_type;
    }
    if (j.contains("manifests")) {
        return MEDIA_TYPE_OCI_INDEX;
    }
    if (j.contains("layers") && j.contains("config")) {
        return MEDIA_TYPE_OCI_MANIFEST;
    }
    return "";
}

} // namespace

// ============================================================================
// Manifest
// ============================================================================

std::vector<PlatformDescriptor> Manifest::platforms() const {
    std::vector<PlatformDescriptor> result;
    if (const auto* list = std::get_if<PlatformListManifest>(&content_)) {
        for (const auto& entry : list->entries) {
            result.push_back(entry.platform.value_or(PlatformDescriptor{}));
        }
    }
    return result;
}

Result<Manifest> parse_manifest(const ManifestPayload& payload) {
    json j;
    try {
        j = json::parse(payload.body);
    } catch (const json::exception& e) {
        return Result<Manifest>::err(unexpected_manifest(std::string("invalid JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return Result<Manifest>::err(unexpected_manifest("document is not an object"));
    }

    // Content-Type may carry parameters ("; charset=utf-8")
    std::string media_type = payload.media_type.substr(0, payload.media_type.find(';'));
    if (media_type.empty() || media_type == "application/json") {
        media_type = sniff_media_type(j);
    }

    if (media_type == MEDIA_TYPE_DOCKER_MANIFEST_LIST || media_type == MEDIA_TYPE_OCI_INDEX) {
        if (!j.contains("manifests") || !j["manifests"].is_array()) {
            return Result<Manifest>::err(unexpected_manifest("platform list without manifests"));
        }
        PlatformListManifest list;
        for (const auto& entry : j["manifests"]) {
            auto desc = parse_descriptor(entry);
            if (desc.isErr()) {
                return Result<Manifest>::err(desc.error());
            }
            list.entries.push_back(std::move(desc.value()));
        }
        return Result<Manifest>::ok(Manifest(media_type, std::move(list)));
    }

    if (media_type == MEDIA_TYPE_DOCKER_MANIFEST || media_type == MEDIA_TYPE_OCI_MANIFEST) {
        SinglePlatformManifest single;
        if (j.contains("config")) {
            auto config = parse_descriptor(j["config"]);
            if (config.isErr()) {
                return Result<Manifest>::err(config.error());
            }
            single.config = std::move(config.value());
        }
        if (j.contains("layers") && j["layers"].is_array()) {
            for (const auto& layer : j["layers"]) {
                auto desc = parse_descriptor(layer);
                if (desc.isErr()) {
                    return Result<Manifest>::err(desc.error());
                }
                single.layers.push_back(std::move(desc.value()));
            }
        }
        return Result<Manifest>::ok(Manifest(media_type, std::move(single)));
    }

    return Result<Manifest>::err(unexpected_manifest(
        media_type.empty() ? std::string("unknown media type") : media_type));
}

// ============================================================================
// Bundle Manifest
// ============================================================================

Result<BuiltManifest> build_bundle_manifest(const BlobDescriptor& layer,
                                            const std::map<std::string, std::string>& annotations) {
    BuiltManifest built;
    built.media_type = MEDIA_TYPE_OCI_MANIFEST;

    // The bundle has no image configuration; reference an empty config blob
    built.config_data = "";
    auto config_digest = content_digest(built.config_data);
    if (config_digest.isErr()) {
        return Result<BuiltManifest>::err(config_digest.error());
    }
    built.config.media_type = MEDIA_TYPE_OCI_CONFIG;
    built.config.digest = config_digest.value();
    built.config.size = 0;

    json j;
    j["schemaVersion"] = 2;
    j["mediaType"] = MEDIA_TYPE_OCI_MANIFEST;
    j["config"] = descriptor_to_json(built.config);
    j["layers"] = json::array({descriptor_to_json(layer)});
    if (!annotations.empty()) {
        j["annotations"] = annotations;
    }

    built.payload = j.dump();
    return Result<BuiltManifest>::ok(std::move(built));
}

} // namespace stowage
