#include <doctest/doctest.h>
#include <stowage/digest.hpp>
#include <stowage/manifest.hpp>

#include "test_support.hpp"

#include <nlohmann/json.hpp>

using namespace stowage;
using namespace stowage::testing;

TEST_CASE("parse_manifest decodes a single-platform manifest") {
    auto result = parse_manifest(single_platform_manifest());
    REQUIRE(result.isOk());

    const auto& manifest = result.value();
    CHECK_FALSE(manifest.is_platform_list());
    CHECK(manifest.platforms().empty());

    const auto& single = std::get<SinglePlatformManifest>(manifest.content());
    CHECK(single.config.digest == sha('c'));
    REQUIRE(single.layers.size() == 1);
    CHECK(single.layers[0].size == 2811969);
}

TEST_CASE("parse_manifest decodes a platform list in order") {
    auto result = parse_manifest(platform_list_manifest());
    REQUIRE(result.isOk());

    const auto& manifest = result.value();
    CHECK(manifest.is_platform_list());
    auto platforms = manifest.platforms();
    REQUIRE(platforms.size() == 3);
    CHECK(platforms[0].architecture == "amd64");
    CHECK(platforms[1].architecture == "arm64");
    CHECK(platforms[2].architecture == "arm");
    CHECK(platforms[2].variant == "v7");
}

TEST_CASE("parse_manifest sniffs the type when no media type is given") {
    ManifestPayload index;
    index.media_type = "application/json";
    index.body = R"({"schemaVersion": 2, "manifests": [
        {"mediaType": "application/vnd.oci.image.manifest.v1+json",
         "digest": "sha256:1111111111111111111111111111111111111111111111111111111111111111",
         "size": 10, "platform": {"architecture": "s390x", "os": "linux"}}]})";
    auto result = parse_manifest(index);
    REQUIRE(result.isOk());
    CHECK(result.value().media_type() == MEDIA_TYPE_OCI_INDEX);
    CHECK(result.value().platforms()[0].architecture == "s390x");

    ManifestPayload image;
    image.body = R"({"schemaVersion": 2,
        "config": {"digest": "sha256:cccccccccccccccccccccccccccccccccccccccccccccccccccccccccccccccc"},
        "layers": []})";
    auto single = parse_manifest(image);
    REQUIRE(single.isOk());
    CHECK(single.value().media_type() == MEDIA_TYPE_OCI_MANIFEST);
}

TEST_CASE("parse_manifest strips content type parameters") {
    auto payload = platform_list_manifest();
    payload.media_type += "; charset=utf-8";
    auto result = parse_manifest(payload);
    REQUIRE(result.isOk());
    CHECK(result.value().is_platform_list());
}

TEST_CASE("parse_manifest rejects unexpected documents") {
    SUBCASE("schema1 manifest") {
        ManifestPayload payload;
        payload.media_type = "application/vnd.docker.distribution.manifest.v1+prettyjws";
        payload.body = R"({"schemaVersion": 1, "name": "library/nginx"})";
        auto result = parse_manifest(payload);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::RESOLUTION_ERROR);
        CHECK(result.error().message().find("unexpected manifest") != std::string::npos);
    }
    SUBCASE("invalid JSON") {
        ManifestPayload payload;
        payload.body = "{not json";
        auto result = parse_manifest(payload);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::RESOLUTION_ERROR);
    }
    SUBCASE("list entry without digest") {
        ManifestPayload payload;
        payload.media_type = MEDIA_TYPE_OCI_INDEX;
        payload.body = R"({"manifests": [{"mediaType": "x", "size": 1}]})";
        auto result = parse_manifest(payload);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::RESOLUTION_ERROR);
    }
}

TEST_CASE("build_bundle_manifest references the layer and an empty config") {
    BlobDescriptor layer;
    layer.media_type = MEDIA_TYPE_BUNDLE;
    layer.digest = sha('e');
    layer.size = 4096;

    auto result = build_bundle_manifest(layer, {{BUNDLE_KIND, BUNDLE_VERSION}});
    REQUIRE(result.isOk());
    const auto& built = result.value();

    CHECK(built.media_type == MEDIA_TYPE_OCI_MANIFEST);
    CHECK(built.config.media_type == MEDIA_TYPE_OCI_CONFIG);
    CHECK(built.config.size == 0);
    CHECK(built.config_data.empty());
    // SHA-256 of the empty string
    CHECK(built.config.digest ==
          "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto j = nlohmann::json::parse(built.payload);
    CHECK(j["schemaVersion"] == 2);
    CHECK(j["mediaType"] == MEDIA_TYPE_OCI_MANIFEST);
    CHECK(j["config"]["digest"] == built.config.digest);
    REQUIRE(j["layers"].size() == 1);
    CHECK(j["layers"][0]["mediaType"] == "application/tar+gzip");
    CHECK(j["layers"][0]["digest"] == sha('e'));
    CHECK(j["layers"][0]["size"] == 4096);
    CHECK(j["annotations"]["compose-app"] == "v1");
}

TEST_CASE("built bundle manifests parse back as single-platform manifests") {
    BlobDescriptor layer;
    layer.media_type = MEDIA_TYPE_BUNDLE;
    layer.digest = sha('f');
    layer.size = 1;

    auto built = build_bundle_manifest(layer, {});
    REQUIRE(built.isOk());

    ManifestPayload payload{built.value().media_type, built.value().payload};
    auto parsed = parse_manifest(payload);
    REQUIRE(parsed.isOk());
    CHECK_FALSE(parsed.value().is_platform_list());
}

TEST_CASE("content_digest and verify_content_digest") {
    auto digest = content_digest(std::string("hello"));
    REQUIRE(digest.isOk());
    CHECK(digest.value() ==
          "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

    CHECK(verify_content_digest("hello", digest.value()).isOk());

    auto mismatch = verify_content_digest("hello!", digest.value());
    REQUIRE(mismatch.isErr());
    CHECK(mismatch.error().code() == ErrorCode::RESOLUTION_ERROR);

    // Other algorithms cannot be checked locally
    CHECK(verify_content_digest("hello", "sha512:" + std::string(128, 'a')).isOk());
}
