#include <doctest/doctest.h>
#include <stowage/archive.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <filesystem>

#include <sys/stat.h>

namespace fs = std::filesystem;

using namespace stowage;
using stowage::testing::TempDir;

namespace {

std::vector<std::string> entry_names(const std::vector<ArchiveEntry>& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.name);
    }
    return names;
}

const ArchiveEntry* find_entry(const std::vector<ArchiveEntry>& entries, const std::string& name) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const ArchiveEntry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

std::vector<ArchiveEntry> build_and_read(const BundleOptions& options,
                                         const std::string& descriptor,
                                         EventSink* events = nullptr) {
    auto built = ArchiveBuilder(options, events).build(descriptor);
    REQUIRE_MESSAGE(built.isOk(), (built.isErr() ? built.error().toString() : ""));
    auto read = read_archive(built.value().data);
    REQUIRE(read.isOk());
    return read.value();
}

BundleOptions options_for(const TempDir& dir) {
    BundleOptions options;
    options.root = dir.path();
    return options;
}

} // namespace

TEST_CASE("ArchiveBuilder substitutes the descriptor from memory") {
    TempDir dir;
    dir.write("docker-compose.yml", "services: {}\n");
    dir.write("config/app.conf", "listen 80;\n");

    auto entries = build_and_read(options_for(dir), "pinned: true\n");

    auto* descriptor = find_entry(entries, "docker-compose.yml");
    REQUIRE(descriptor != nullptr);
    CHECK(descriptor->data == "pinned: true\n");
    CHECK(descriptor->size == std::string("pinned: true\n").size());

    auto* conf = find_entry(entries, "config/app.conf");
    REQUIRE(conf != nullptr);
    CHECK(conf->data == "listen 80;\n");
    CHECK(conf->kind == ArchiveEntryKind::Regular);
}

TEST_CASE("ArchiveBuilder adds the descriptor when it is not on disk") {
    TempDir dir;
    dir.write("README", "hello");

    auto entries = build_and_read(options_for(dir), "services: {}\n");
    CHECK(entry_names(entries) == std::vector<std::string>{"README", "docker-compose.yml"});
    CHECK(find_entry(entries, "docker-compose.yml")->data == "services: {}\n");
}

TEST_CASE("ArchiveBuilder only substitutes the descriptor at the root") {
    TempDir dir;
    dir.write("docker-compose.yml", "root\n");
    dir.write("nested/docker-compose.yml", "nested\n");

    auto entries = build_and_read(options_for(dir), "memory\n");
    CHECK(find_entry(entries, "docker-compose.yml")->data == "memory\n");
    CHECK(find_entry(entries, "nested/docker-compose.yml")->data == "nested\n");
}

TEST_CASE("ArchiveBuilder applies ignore patterns per entry") {
    TempDir dir;
    dir.write(".composeappignores", "*.log\nsub/*\n");
    dir.write("docker-compose.yml", "x");
    dir.write("main.txt", "keep");
    dir.write("debug.log", "drop");
    dir.write("error.log", "drop");
    dir.write("sub/file", "drop");
    dir.write("sub/deeper/kept", "keep");
    dir.write("logs/app.log", "keep");

    EventCollector events;
    auto entries = build_and_read(options_for(dir), "services: {}\n", &events);

    CHECK(entry_names(entries) == std::vector<std::string>{
        "docker-compose.yml",
        "logs/app.log",
        "main.txt",
        "sub/deeper/kept",
    });

    // One event per pattern, however many entries it excluded
    auto ignored = events.of_kind(EventKind::pattern_ignored);
    std::vector<std::string> patterns;
    for (const auto& event : ignored) {
        patterns.push_back(event.field("pattern"));
    }
    std::sort(patterns.begin(), patterns.end());
    CHECK(patterns == std::vector<std::string>{"*.log", ".composeappignores", "sub/*"});
}

TEST_CASE("ArchiveBuilder excludes a subdirectory's files by pattern") {
    TempDir dir;
    dir.write(".composeappignores", "sub/*\n");
    dir.write("a.txt", "a");
    dir.write("sub/b.txt", "b");

    auto entries = build_and_read(options_for(dir), "services: {}\n");
    CHECK(entry_names(entries) == std::vector<std::string>{"a.txt", "docker-compose.yml"});
}

TEST_CASE("ArchiveBuilder emits one entry per file and symlink") {
    TempDir dir;
    dir.write("docker-compose.yml", "x");
    dir.write("one", "1");
    dir.write("nested/two", "2");
    dir.write("nested/deeper/three", "3");
    dir.mkdir("empty");
    fs::create_symlink("one", fs::path(dir.path()) / "nested" / "link");

    auto entries = build_and_read(options_for(dir), "services: {}\n");
    CHECK(entries.size() == 5);
    for (const auto& entry : entries) {
        CHECK(entry.kind != ArchiveEntryKind::Directory);
        CHECK(entry.name[0] != '/');
    }
}

TEST_CASE("ArchiveBuilder counts the synthesized descriptor as an extra entry") {
    TempDir dir;
    dir.write("one", "1");
    dir.write("nested/two", "2");
    fs::create_symlink("one", fs::path(dir.path()) / "nested" / "link");

    // Three filesystem entries plus the descriptor created from memory
    auto entries = build_and_read(options_for(dir), "services: {}\n");
    CHECK(entries.size() == 4);
    REQUIRE(find_entry(entries, "docker-compose.yml") != nullptr);
}

TEST_CASE("ArchiveBuilder never ignores the descriptor") {
    TempDir dir;
    dir.write(".composeappignores", "*.yml\n");
    dir.write("docker-compose.yml", "x");
    dir.write("other.yml", "y");

    auto entries = build_and_read(options_for(dir), "services: {}\n");
    CHECK(entry_names(entries) == std::vector<std::string>{"docker-compose.yml"});
}

TEST_CASE("ArchiveBuilder directory pruning is opt-in") {
    TempDir dir;
    dir.write(".composeappignores", "cache\n");
    dir.write("cache/blob", "data");
    dir.write("app.txt", "data");

    SUBCASE("default tests each entry") {
        auto entries = build_and_read(options_for(dir), "services: {}\n");
        CHECK(find_entry(entries, "cache/blob") != nullptr);
    }

    SUBCASE("pruning skips the matched subtree") {
        auto options = options_for(dir);
        options.prune_excluded_directories = true;
        EventCollector events;
        auto entries = build_and_read(options, "services: {}\n", &events);
        CHECK(find_entry(entries, "cache/blob") == nullptr);
        CHECK(find_entry(entries, "app.txt") != nullptr);
        CHECK(events.count(EventKind::pattern_ignored) == 2);
    }
}

TEST_CASE("ArchiveBuilder records symlinks without following them") {
    TempDir dir;
    dir.write("target.txt", "content");
    fs::create_symlink("target.txt", fs::path(dir.path()) / "link");

    auto entries = build_and_read(options_for(dir), "services: {}\n");
    auto* link = find_entry(entries, "link");
    REQUIRE(link != nullptr);
    CHECK(link->kind == ArchiveEntryKind::Symlink);
    CHECK(link->linkname == "target.txt");
    CHECK(link->size == 0);
}

TEST_CASE("ArchiveBuilder rejects irregular entries") {
    TempDir dir;
    dir.write("app.txt", "data");
    std::string fifo = dir.path() + "/pipe";
    REQUIRE(::mkfifo(fifo.c_str(), 0644) == 0);

    auto built = ArchiveBuilder(options_for(dir)).build("services: {}\n");
    REQUIRE(built.isErr());
    CHECK(built.error().code() == ErrorCode::UNSUPPORTED_ENTRY);
    CHECK(built.error().message().find("pipe") != std::string::npos);

    SUBCASE("unless they are ignored") {
        dir.write(".composeappignores", "pipe\n");
        auto retry = ArchiveBuilder(options_for(dir)).build("services: {}\n");
        CHECK(retry.isOk());
    }
}

TEST_CASE("ArchiveBuilder keeps file modes and reports its entries") {
    TempDir dir;
    dir.write("run.sh", "#!/bin/sh\n");
    fs::permissions(fs::path(dir.path()) / "run.sh", fs::perms(0755));

    auto built = ArchiveBuilder(options_for(dir)).build("services: {}\n");
    REQUIRE(built.isOk());
    REQUIRE(built.value().entries.size() == 2);
    CHECK(built.value().entries[1].name == "run.sh");
    CHECK(built.value().entries[1].data.empty());

    auto read = read_archive(built.value().data);
    REQUIRE(read.isOk());
    CHECK(find_entry(read.value(), "run.sh")->mode == 0755);
}

TEST_CASE("ArchiveBuilder fails when the root is not a directory") {
    BundleOptions options;
    options.root = "/nonexistent/stowage/root";
    auto built = ArchiveBuilder(options).build("services: {}\n");
    REQUIRE(built.isErr());
    CHECK(built.error().code() == ErrorCode::ARCHIVE_ERROR);
}

TEST_CASE("write_archive produces a gzip stream read_archive understands") {
    std::vector<ArchiveEntry> entries(3);
    entries[0].name = "dir";
    entries[0].kind = ArchiveEntryKind::Directory;
    entries[0].mode = 0755;
    entries[1].name = "dir/file.txt";
    entries[1].data = std::string(1000, 'z');
    entries[1].size = 1000;
    entries[2].name = "dir/link";
    entries[2].kind = ArchiveEntryKind::Symlink;
    entries[2].linkname = "file.txt";

    auto data = write_archive(entries);
    REQUIRE(data.isOk());
    REQUIRE(data.value().size() > 10);
    CHECK(data.value()[0] == 0x1f);
    CHECK(data.value()[1] == 0x8b);

    auto read = read_archive(data.value());
    REQUIRE(read.isOk());
    REQUIRE(read.value().size() == 3);
    CHECK(read.value()[0].kind == ArchiveEntryKind::Directory);
    CHECK(read.value()[0].name == "dir");
    CHECK(read.value()[1].data == std::string(1000, 'z'));
    CHECK(read.value()[2].linkname == "file.txt");
}

TEST_CASE("write_archive splits long names into prefix and name") {
    std::string long_name = std::string(80, 'a') + "/" + std::string(80, 'b') + "/file";
    std::vector<ArchiveEntry> entries(1);
    entries[0].name = long_name;
    entries[0].data = "x";
    entries[0].size = 1;

    auto data = write_archive(entries);
    REQUIRE(data.isOk());
    auto read = read_archive(data.value());
    REQUIRE(read.isOk());
    CHECK(read.value()[0].name == long_name);

    entries[0].name = std::string(300, 'c');
    auto too_long = write_archive(entries);
    REQUIRE(too_long.isErr());
    CHECK(too_long.error().code() == ErrorCode::ARCHIVE_ERROR);
}

TEST_CASE("read_archive rejects data that is not a gzip stream") {
    std::vector<uint8_t> garbage(64, 0x42);
    auto read = read_archive(garbage);
    REQUIRE(read.isErr());
    CHECK(read.error().code() == ErrorCode::ARCHIVE_ERROR);
}
