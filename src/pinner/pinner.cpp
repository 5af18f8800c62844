#include "stowage/pinner.hpp"

#include <spdlog/spdlog.h>

namespace stowage {

// ============================================================================
// Strategies
// ============================================================================

Result<Resolution> EngineDigestResolver::resolve(const ImageReference& ref) {
    auto inspection = engine_.inspect_distribution(ref);
    if (inspection.isErr()) {
        return Result<Resolution>::err(inspection.error());
    }

    Resolution resolution;
    resolution.digest = std::move(inspection.value().digest);
    resolution.platforms = std::move(inspection.value().platforms);
    return Result<Resolution>::ok(std::move(resolution));
}

Result<Resolution> RegistryDigestResolver::resolve(const ImageReference& ref) {
    auto repo = registry_.resolve_repository(ref);
    if (repo.isErr()) {
        return Result<Resolution>::err(repo.error());
    }

    auto desc = registry_.get_tag(repo.value(), ref.tag.value_or(DEFAULT_TAG));
    if (desc.isErr()) {
        return Result<Resolution>::err(desc.error());
    }
    std::string digest = desc.value().digest;

    auto payload = registry_.get_manifest(repo.value(), digest);
    if (payload.isErr()) {
        return Result<Resolution>::err(payload.error());
    }

    auto manifest = parse_manifest(payload.value());
    if (manifest.isErr()) {
        return Result<Resolution>::err(manifest.error());
    }

    Resolution resolution;
    resolution.digest = digest;
    resolution.platforms = manifest.value().platforms();
    return Result<Resolution>::ok(std::move(resolution));
}

// ============================================================================
// Pinning
// ============================================================================

std::string format_platforms(const std::vector<PlatformDescriptor>& platforms) {
    std::string out;
    for (size_t i = 0; i < platforms.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += platforms[i].architecture;
        if (platforms[i].architecture == "arm") {
            out += platforms[i].variant;
        }
    }
    return out;
}

Result<ImageReference> ReferencePinner::pin_image(const std::string& image, Resolution* resolution) {
    auto expanded = expand_default_placeholder(image);
    if (expanded.isErr()) {
        return Result<ImageReference>::err(expanded.error());
    }

    auto ref = parse_normalized_reference(expanded.value());
    if (ref.isErr()) {
        return Result<ImageReference>::err(ref.error());
    }

    if (!ref.value().tag) {
        return Result<ImageReference>::err(Error(ErrorCode::REFERENCE_ERROR,
            "invalid image reference (" + expanded.value() + "): images must be tagged, e.g. " +
            expanded.value() + ":stable"));
    }

    ImageReference tagged = ref.value();
    tagged.digest.reset();

    auto resolved = resolver_.resolve(tagged);
    if (resolved.isErr()) {
        return Result<ImageReference>::err(resolved.error());
    }

    ImageReference pinned = ref.value().pinned(resolved.value().digest);
    if (resolution) {
        *resolution = std::move(resolved.value());
    }
    return Result<ImageReference>::ok(std::move(pinned));
}

Status ReferencePinner::pin_images(AppDescriptor& descriptor) {
    std::vector<std::string> names;
    for (const auto& entry : descriptor.services()) {
        names.push_back(entry.first);
    }

    for (const auto& name : names) {
        std::string image = descriptor.find_service(name)->image;
        if (image.empty()) {
            return Status::err(Error(ErrorCode::INPUT_ERROR,
                "Service(" + name + ") missing 'image' attribute"));
        }

        emit_event(events_, EventKind::service_pinning, {{"service", name}, {"image", image}});

        Resolution resolution;
        auto pinned = pin_image(image, &resolution);
        if (pinned.isErr()) {
            return Status::err(pinned.error().withContext("Service(" + name + ")"));
        }

        std::string value = pinned.value().to_string();
        auto stored = descriptor.set_image(name, value);
        if (stored.isErr()) {
            return stored;
        }
        spdlog::debug("pinned {} to {}", name, value);

        emit_event(events_, EventKind::service_pinned, {
            {"service", name},
            {"image", image},
            {"platforms", format_platforms(resolution.platforms)},
            {"pinned", value},
        });
    }
    return Status::ok();
}

} // namespace stowage
