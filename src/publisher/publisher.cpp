#include "stowage/publisher.hpp"
#include "stowage/manifest.hpp"
#include "stowage/reference.hpp"

#include <spdlog/spdlog.h>

namespace stowage {

namespace {

Error publish_error(const Error& cause) {
    if (cause.code() == ErrorCode::PUBLISH_ERROR) {
        return cause;
    }
    return Error(ErrorCode::PUBLISH_ERROR, cause.message());
}

} // namespace

Result<PublishResult> BundlePublisher::publish(const AppDescriptor& descriptor,
                                               const std::string& target,
                                               const BundleOptions& options) {
    auto serialized = descriptor.serialize();
    if (serialized.isErr()) {
        return Result<PublishResult>::err(serialized.error());
    }

    ArchiveBuilder builder(options, events_);
    auto archive = builder.build(serialized.value());
    if (archive.isErr()) {
        return Result<PublishResult>::err(archive.error());
    }

    auto parsed = parse_normalized_reference(target);
    if (parsed.isErr()) {
        return Result<PublishResult>::err(parsed.error());
    }
    if (parsed.value().digest) {
        return Result<PublishResult>::err(Error(ErrorCode::REFERENCE_ERROR,
            "publish target must be a tag, not a digest: " + target));
    }
    ImageReference ref = parsed.value().with_tag_default();
    const std::string& tag = *ref.tag;

    auto repo = registry_.resolve_repository(ref);
    if (repo.isErr()) {
        return Result<PublishResult>::err(repo.error());
    }

    const auto& bytes = archive.value().data;
    auto blob = registry_.put_blob(repo.value(), MEDIA_TYPE_BUNDLE,
                                   std::string(bytes.begin(), bytes.end()));
    if (blob.isErr()) {
        return Result<PublishResult>::err(publish_error(blob.error()));
    }
    emit_event(events_, EventKind::blob_uploaded, {
        {"digest", blob.value().digest},
        {"media_type", MEDIA_TYPE_BUNDLE},
        {"size", std::to_string(bytes.size())},
    });

    auto manifest = build_bundle_manifest(blob.value(), {{BUNDLE_KIND, BUNDLE_VERSION}});
    if (manifest.isErr()) {
        return Result<PublishResult>::err(publish_error(manifest.error()));
    }

    // The manifest references an empty config blob that must exist too
    auto config = registry_.put_blob(repo.value(), manifest.value().config.media_type,
                                     manifest.value().config_data);
    if (config.isErr()) {
        return Result<PublishResult>::err(publish_error(config.error()));
    }

    auto digest = registry_.put_manifest(repo.value(), manifest.value(), tag);
    if (digest.isErr()) {
        return Result<PublishResult>::err(publish_error(digest.error()));
    }

    PublishResult result;
    result.reference = ref.to_string();
    result.tag = tag;
    result.blob_digest = blob.value().digest;
    result.manifest_digest = digest.value();
    result.archive_size = bytes.size();

    emit_event(events_, EventKind::manifest_pushed, {
        {"digest", result.manifest_digest},
        {"tag", tag},
        {"reference", result.reference},
    });
    spdlog::debug("published {} ({} bytes)", result.reference, result.archive_size);

    return Result<PublishResult>::ok(std::move(result));
}

} // namespace stowage
