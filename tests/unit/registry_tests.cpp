#include <doctest/doctest.h>
#include <stowage/engine.hpp>
#include <stowage/registry.hpp>

using namespace stowage;

TEST_CASE("parse_auth_challenge reads bearer parameters") {
    auto params = parse_auth_challenge(
        "Bearer realm=\"https://auth.docker.io/token\",service=\"registry.docker.io\","
        "scope=\"repository:library/nginx:pull\"");
    CHECK(params["scheme"] == "bearer");
    CHECK(params["realm"] == "https://auth.docker.io/token");
    CHECK(params["service"] == "registry.docker.io");
    CHECK(params["scope"] == "repository:library/nginx:pull");
}

TEST_CASE("parse_auth_challenge handles basic and unquoted forms") {
    auto basic = parse_auth_challenge("Basic realm=Registry");
    CHECK(basic["scheme"] == "basic");
    CHECK(basic["realm"] == "Registry");

    auto bare = parse_auth_challenge("Bearer");
    CHECK(bare["scheme"] == "bearer");
    CHECK(bare.count("realm") == 0);
}

TEST_CASE("registry_endpoint") {
    ClientConfig config;
    config.insecure_registries = {"localhost:5000"};

    CHECK(registry_endpoint("docker.io", config) == "https://registry-1.docker.io");
    CHECK(registry_endpoint("ghcr.io", config) == "https://ghcr.io");
    CHECK(registry_endpoint("localhost:5000", config) == "http://localhost:5000");
}

TEST_CASE("HttpRegistryClient resolve_repository maps the endpoint") {
    ClientConfig config;
    config.insecure_registries = {"registry.local"};
    HttpRegistryClient client(config);

    ImageReference ref;
    ref.domain = "registry.local";
    ref.path = "team/app";
    ref.tag = "v1";

    auto repo = client.resolve_repository(ref);
    REQUIRE(repo.isOk());
    CHECK(repo.value().endpoint == "http://registry.local");
    CHECK(repo.value().path == "team/app");
    CHECK(repo.value().name() == "registry.local/team/app");
}

TEST_CASE("url_escape") {
    CHECK(url_escape("repository:library/nginx:pull,push") ==
          "repository%3Alibrary%2Fnginx%3Apull%2Cpush");
    CHECK(url_escape("plain-text_1.0~") == "plain-text_1.0~");
}

TEST_CASE("parse_distribution_inspection reads digest and platforms") {
    auto result = parse_distribution_inspection(R"({
        "Descriptor": {
            "mediaType": "application/vnd.docker.distribution.manifest.list.v2+json",
            "digest": "sha256:aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa",
            "size": 1862
        },
        "Platforms": [
            {"architecture": "amd64", "os": "linux"},
            {"architecture": "arm", "os": "linux", "variant": "v7"}
        ]
    })");
    REQUIRE(result.isOk());
    CHECK(result.value().digest == "sha256:" + std::string(64, 'a'));
    REQUIRE(result.value().platforms.size() == 2);
    CHECK(result.value().platforms[1].variant == "v7");
}

TEST_CASE("parse_distribution_inspection rejects responses without a digest") {
    for (const char* body : {"{}", "not json", R"({"Descriptor": {"digest": "sha256:short"}})"}) {
        auto result = parse_distribution_inspection(body);
        REQUIRE_MESSAGE(result.isErr(), body);
        CHECK(result.error().code() == ErrorCode::RESOLUTION_ERROR);
    }
}

TEST_CASE("parse_distribution_inspection skips non-string platform fields") {
    auto result = parse_distribution_inspection(R"({
        "Descriptor": {"digest": "sha256:aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"},
        "Platforms": [{"architecture": "amd64", "os": "linux", "variant": 7}]
    })");
    REQUIRE(result.isOk());
    REQUIRE(result.value().platforms.size() == 1);
    CHECK(result.value().platforms[0].architecture == "amd64");
    CHECK(result.value().platforms[0].os == "linux");
    CHECK(result.value().platforms[0].variant.empty());
}

TEST_CASE("parse_content_length") {
    CHECK(parse_content_length("1862") == 1862);
    CHECK(parse_content_length("0") == 0);
    CHECK(parse_content_length("") == -1);
    CHECK(parse_content_length("12a") == -1);
    CHECK(parse_content_length("-5") == -1);
    CHECK(parse_content_length("99999999999999999999999999") == -1);
}
