#include <doctest/doctest.h>
#include <stowage/descriptor.hpp>

#include "test_support.hpp"

#include <yaml-cpp/yaml.h>

using namespace stowage;
using stowage::testing::TempDir;

namespace {

const char* kComposeText = R"(version: "3.8"
services:
  web:
    image: nginx:stable
    ports:
      - "8080:80"
  db:
    environment:
      POSTGRES_PASSWORD: secret
    image: postgres:15
volumes:
  data: {}
)";

} // namespace

TEST_CASE("AppDescriptor parses services and their images") {
    auto result = AppDescriptor::parse(kComposeText);
    REQUIRE(result.isOk());

    const auto& descriptor = result.value();
    CHECK(descriptor.services().size() == 2);
    REQUIRE(descriptor.has_service("web"));
    CHECK(descriptor.find_service("web")->image == "nginx:stable");
    CHECK(descriptor.find_service("db")->image == "postgres:15");
    CHECK(descriptor.find_service("cache") == nullptr);

    // Iteration is in name order
    auto it = descriptor.services().begin();
    CHECK(it->first == "db");
    ++it;
    CHECK(it->first == "web");
}

TEST_CASE("AppDescriptor rejects malformed services") {
    SUBCASE("service is not a mapping") {
        auto result = AppDescriptor::parse("services:\n  web: nginx\n");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
        CHECK(result.error().message() == "Service(web) has invalid format");
    }
    SUBCASE("missing image") {
        auto result = AppDescriptor::parse("services:\n  web:\n    ports: []\n");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
        CHECK(result.error().message() == "Service(web) missing 'image' attribute");
    }
    SUBCASE("image is not a string") {
        auto result = AppDescriptor::parse("services:\n  web:\n    image: [a, b]\n");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
        CHECK(result.error().message() == "Service(web) invalid 'image' attribute");
    }
    SUBCASE("image is a number or boolean") {
        for (const char* value : {"123", "1.5", "true", "off"}) {
            auto result = AppDescriptor::parse(
                std::string("services:\n  web:\n    image: ") + value + "\n");
            REQUIRE_MESSAGE(result.isErr(), value);
            CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
            CHECK(result.error().message() == "Service(web) invalid 'image' attribute");
        }
    }
    SUBCASE("quoted numeric image is a string") {
        auto result = AppDescriptor::parse("services:\n  web:\n    image: \"123\"\n");
        REQUIRE(result.isOk());
        CHECK(result.value().find_service("web")->image == "123");
    }
    SUBCASE("duplicate service name") {
        auto result = AppDescriptor::parse(
            "services:\n  web:\n    image: a:1\n  web:\n    image: b:1\n");
        REQUIRE(result.isErr());
        CHECK(result.error().message() == "Service(web) is defined more than once");
    }
    SUBCASE("document is not a mapping") {
        auto result = AppDescriptor::parse("- a\n- b\n");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
    }
    SUBCASE("invalid YAML") {
        auto result = AppDescriptor::parse("services: [\n");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INPUT_ERROR);
    }
}

TEST_CASE("AppDescriptor accepts a descriptor without services") {
    auto result = AppDescriptor::parse("version: \"3\"\n");
    REQUIRE(result.isOk());
    CHECK(result.value().services().empty());
}

TEST_CASE("AppDescriptor serialize keeps non-image fields") {
    auto result = AppDescriptor::parse(kComposeText);
    REQUIRE(result.isOk());
    auto& descriptor = result.value();

    REQUIRE(descriptor.set_image("web", "docker.io/library/nginx@sha256:" + std::string(64, 'a')).isOk());

    auto text = descriptor.serialize();
    REQUIRE(text.isOk());

    YAML::Node doc = YAML::Load(text.value());
    CHECK(doc["version"].as<std::string>() == "3.8");
    CHECK(doc["volumes"]["data"].IsMap());
    CHECK(doc["services"]["web"]["image"].as<std::string>() ==
          "docker.io/library/nginx@sha256:" + std::string(64, 'a'));
    CHECK(doc["services"]["web"]["ports"][0].as<std::string>() == "8080:80");
    CHECK(doc["services"]["db"]["environment"]["POSTGRES_PASSWORD"].as<std::string>() == "secret");

    // "image" comes first within a service
    auto first = doc["services"]["db"].begin();
    CHECK(first->first.as<std::string>() == "image");
}

TEST_CASE("AppDescriptor serialize is stable across a reparse") {
    auto first = AppDescriptor::parse(kComposeText);
    REQUIRE(first.isOk());
    auto text = first.value().serialize();
    REQUIRE(text.isOk());

    auto second = AppDescriptor::parse(text.value());
    REQUIRE(second.isOk());
    auto again = second.value().serialize();
    REQUIRE(again.isOk());
    CHECK(again.value() == text.value());
}

TEST_CASE("AppDescriptor set_image fails for unknown services") {
    auto result = AppDescriptor::parse(kComposeText);
    REQUIRE(result.isOk());
    auto status = result.value().set_image("cache", "redis:7");
    REQUIRE(status.isErr());
    CHECK(status.error().code() == ErrorCode::INPUT_ERROR);
}

TEST_CASE("AppDescriptor add_service builds a descriptor from scratch") {
    AppDescriptor descriptor;
    descriptor.add_service("web", "nginx:stable");

    auto text = descriptor.serialize();
    REQUIRE(text.isOk());
    YAML::Node doc = YAML::Load(text.value());
    CHECK(doc["services"]["web"]["image"].as<std::string>() == "nginx:stable");
}

TEST_CASE("AppDescriptor load reads a file") {
    TempDir dir;
    dir.write("docker-compose.yml", kComposeText);

    auto result = AppDescriptor::load(dir.path() + "/docker-compose.yml");
    REQUIRE(result.isOk());
    CHECK(result.value().services().size() == 2);

    auto missing = AppDescriptor::load(dir.path() + "/absent.yml");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::INPUT_ERROR);
}
