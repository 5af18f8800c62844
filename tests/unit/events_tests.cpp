#include <doctest/doctest.h>
#include <stowage/events.hpp>
#include <stowage/result.hpp>

using namespace stowage;

TEST_CASE("EventCollector records events in order") {
    EventCollector collector;
    emit_event(&collector, EventKind::service_pinning, {{"service", "web"}, {"image", "nginx:stable"}});
    emit_event(&collector, EventKind::pattern_ignored, {{"pattern", "*.log"}});
    emit_event(&collector, EventKind::service_pinned, {{"service", "web"}, {"pinned", "x"}});

    REQUIRE(collector.events().size() == 3);
    CHECK(collector.events()[0].kind == EventKind::service_pinning);
    CHECK(collector.events()[0].field("image") == "nginx:stable");
    CHECK(collector.events()[1].field("pattern") == "*.log");
    CHECK(collector.events()[2].field("missing").empty());

    CHECK(collector.count(EventKind::service_pinned) == 1);
    CHECK(collector.of_kind(EventKind::blob_uploaded).empty());

    collector.clear();
    CHECK(collector.events().empty());
}

TEST_CASE("emit_event tolerates a null sink") {
    emit_event(nullptr, EventKind::manifest_pushed, {{"digest", "sha256:x"}});
}

TEST_CASE("event and error names") {
    CHECK(std::string(event_kind_to_string(EventKind::blob_uploaded)) == "blob_uploaded");
    CHECK(std::string(error_code_to_string(ErrorCode::UNSUPPORTED_ENTRY)) == "UnsupportedEntryError");
    CHECK(is_archive_error(ErrorCode::UNSUPPORTED_ENTRY));
    CHECK(is_archive_error(ErrorCode::ARCHIVE_ERROR));
    CHECK_FALSE(is_archive_error(ErrorCode::PUBLISH_ERROR));
}

TEST_CASE("Error withContext prefixes the message") {
    Error error(ErrorCode::RESOLUTION_ERROR, "manifest unknown");
    error.withContext("Service(web)");
    CHECK(error.message() == "Service(web): manifest unknown");
    CHECK(error.toString() == "ResolutionError: Service(web): manifest unknown");
}
