#pragma once

/**
 * @file archive.hpp
 * @brief Bundle archive: a gzip-compressed ustar stream of a directory
 *
 * The descriptor entry is always taken from memory, never from disk.
 * It is present even when the directory has no descriptor file, so the entry
 * count is then one more than the regular files and symlinks on disk.
 * Byte-for-byte reproducibility is not guaranteed (mode and mtime come from
 * the filesystem); the entry set, names and contents are stable for a fixed
 * filesystem state and descriptor.
 */

#include "stowage/descriptor.hpp"
#include "stowage/events.hpp"
#include "stowage/result.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stowage {

constexpr const char* IGNORE_FILENAME = ".composeappignores";

// ============================================================================
// Bundle Options
// ============================================================================

struct BundleOptions {
    std::string root = ".";
    std::string ignore_file = IGNORE_FILENAME;
    std::string descriptor_name = DESCRIPTOR_FILENAME;

    // When a directory matches an ignore pattern, skip its whole subtree
    // instead of testing each child on its own
    bool prune_excluded_directories = false;
};

// ============================================================================
// Ignore Rules
// ============================================================================

// Read ignore patterns: one per line, '#' comments and blank lines skipped,
// whitespace trimmed, paths cleaned, a leading '/' dropped.
std::vector<std::string> read_ignore_patterns(std::istream& in);

// Shell-style match (fnmatch with FNM_PATHNAME): '*' and '?' do not
// cross '/'.
bool glob_match(const std::string& pattern, const std::string& path);

// Lexically clean a slash-separated path ("a//b/./c/../d" -> "a/b/d")
std::string clean_path(const std::string& path);

class IgnoreRules {
public:
    IgnoreRules() = default;
    explicit IgnoreRules(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

    // Load `<root>/<ignore_file>`. A missing file yields no rules. An
    // existing file always excludes itself.
    static Result<IgnoreRules> load(const std::string& root, const std::string& ignore_file);

    const std::vector<std::string>& patterns() const { return patterns_; }
    bool empty() const { return patterns_.empty(); }

    // First pattern matching the archive-relative path
    std::optional<std::string> match(const std::string& relative_path) const;

private:
    std::vector<std::string> patterns_;
};

// ============================================================================
// Archive Entries
// ============================================================================

enum class ArchiveEntryKind {
    Regular,
    Symlink,
    Directory,
};

struct ArchiveEntry {
    std::string name;           // Relative, '/'-separated, no leading '/'
    ArchiveEntryKind kind = ArchiveEntryKind::Regular;
    uint64_t size = 0;
    uint32_t mode = 0644;
    int64_t mtime = 0;
    std::string linkname;       // Symlink target
    std::string data;           // Contents (regular files)
};

struct ArchiveResult {
    std::vector<uint8_t> data;          // The .tar.gz stream
    std::vector<ArchiveEntry> entries;  // What was written, contents omitted
};

// ============================================================================
// Archive Builder
// ============================================================================

class ArchiveBuilder {
public:
    explicit ArchiveBuilder(BundleOptions options, EventSink* events = nullptr)
        : options_(std::move(options)), events_(events) {}

    // Walk the bundle root and produce the archive. Emits pattern_ignored
    // the first time each ignore pattern excludes an entry.
    Result<ArchiveResult> build(const std::string& descriptor_bytes) const;

    const BundleOptions& options() const { return options_; }

private:
    BundleOptions options_;
    EventSink* events_;
};

// Encode entries (in the given order) as a gzip-compressed ustar stream
Result<std::vector<uint8_t>> write_archive(const std::vector<ArchiveEntry>& entries);

// Decode a gzip-compressed ustar stream
Result<std::vector<ArchiveEntry>> read_archive(const std::vector<uint8_t>& archive_data);

} // namespace stowage
