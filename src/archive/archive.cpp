#include "stowage/archive.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <zlib.h>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace stowage {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_UID_SIZE = 8;
static constexpr size_t TAR_GID_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_MTIME_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_MAGIC_SIZE = 6;
static constexpr size_t TAR_VERSION_SIZE = 2;
static constexpr size_t TAR_UNAME_SIZE = 32;
static constexpr size_t TAR_GNAME_SIZE = 32;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Largest value an 11-digit octal size field holds
static constexpr uint64_t TAR_MAX_SIZE = 077777777777ULL;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[TAR_UID_SIZE];         // 108
    char gid[TAR_GID_SIZE];         // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[TAR_MTIME_SIZE];     // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                   // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[TAR_MAGIC_SIZE];     // 257
    char version[TAR_VERSION_SIZE]; // 263
    char uname[TAR_UNAME_SIZE];     // 265
    char gname[TAR_GNAME_SIZE];     // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Header Encoding
// ============================================================================

namespace {

Error archive_error(const std::string& message) {
    return Error(ErrorCode::ARCHIVE_ERROR, message);
}

// Write an octal value with leading zeros into a fixed-size field
void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

// Checksum field is summed as if it held spaces
uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }
    return sum;
}

std::string field_string(const char* field, size_t size) {
    return std::string(field, strnlen(field, size));
}

Result<TarHeader> create_tar_header(const ArchiveEntry& entry) {
    TarHeader header;
    std::memset(&header, 0, sizeof(header));

    std::string path = entry.name;
    if (entry.kind == ArchiveEntryKind::Directory && !path.empty() && path.back() != '/') {
        path += '/';
    }

    if (path.size() <= TAR_NAME_SIZE) {
        std::memcpy(header.name, path.data(), path.size());
    } else {
        // Split at a '/' so that prefix and name both fit
        size_t split = path.rfind('/', TAR_PREFIX_SIZE);
        if (split == std::string::npos || split == 0 || path.size() - split - 1 > TAR_NAME_SIZE) {
            return Result<TarHeader>::err(archive_error("path too long for archive: " + entry.name));
        }
        std::memcpy(header.prefix, path.data(), split);
        std::memcpy(header.name, path.data() + split + 1, path.size() - split - 1);
    }

    if (entry.linkname.size() > TAR_LINKNAME_SIZE) {
        return Result<TarHeader>::err(archive_error("symlink target too long: " + entry.name));
    }
    if (entry.kind == ArchiveEntryKind::Regular && entry.size > TAR_MAX_SIZE) {
        return Result<TarHeader>::err(archive_error("file too large for archive: " + entry.name));
    }

    write_octal(header.mode, TAR_MODE_SIZE, entry.mode & 07777);
    write_octal(header.uid, TAR_UID_SIZE, 0);
    write_octal(header.gid, TAR_GID_SIZE, 0);
    write_octal(header.size, TAR_SIZE_SIZE,
                entry.kind == ArchiveEntryKind::Regular ? entry.size : 0);
    write_octal(header.mtime, TAR_MTIME_SIZE,
                entry.mtime > 0 ? static_cast<uint64_t>(entry.mtime) : 0);

    switch (entry.kind) {
        case ArchiveEntryKind::Directory:
            header.typeflag = TAR_DIRTYPE;
            break;
        case ArchiveEntryKind::Symlink:
            header.typeflag = TAR_SYMTYPE;
            std::memcpy(header.linkname, entry.linkname.data(), entry.linkname.size());
            break;
        case ArchiveEntryKind::Regular:
        default:
            header.typeflag = TAR_REGTYPE;
            break;
    }

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';

    // 6 octal digits + NUL + space
    uint32_t checksum = calculate_checksum(header);
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    return Result<TarHeader>::ok(header);
}

// ============================================================================
// Gzip
// ============================================================================

Result<std::vector<uint8_t>> gzip_compress(const std::vector<uint8_t>& data) {
    if (data.size() > UINT_MAX) {
        return Result<std::vector<uint8_t>>::err(archive_error("archive too large to compress"));
    }

    std::vector<uint8_t> result = {
        0x1f, 0x8b,             // Magic
        0x08,                   // Deflate
        0x00,                   // No flags
        0x00, 0x00, 0x00, 0x00, // mtime
        0x00,                   // Extra flags
        0x03,                   // OS = Unix
    };

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate; header and trailer are written by hand
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result<std::vector<uint8_t>>::err(archive_error("gzip initialization failed"));
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> compressed(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return Result<std::vector<uint8_t>>::err(archive_error("gzip compression failed"));
    }

    compressed.resize(strm.total_out);
    result.insert(result.end(), compressed.begin(), compressed.end());

    // Trailer: CRC32 + original size, little-endian
    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    uint32_t size = static_cast<uint32_t>(data.size());
    for (uint32_t word : {crc, size}) {
        result.push_back(word & 0xff);
        result.push_back((word >> 8) & 0xff);
        result.push_back((word >> 16) & 0xff);
        result.push_back((word >> 24) & 0xff);
    }

    return Result<std::vector<uint8_t>>::ok(std::move(result));
}

Result<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& data) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        return Result<std::vector<uint8_t>>::err(archive_error("not a gzip stream"));
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // 15 + 16: zlib parses the gzip header and trailer
    if (inflateInit2(&strm, 15 + 16) != Z_OK) {
        return Result<std::vector<uint8_t>>::err(archive_error("gzip initialization failed"));
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> result;
    uint8_t chunk[64 * 1024];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk;
        strm.avail_out = sizeof(chunk);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return Result<std::vector<uint8_t>>::err(archive_error("corrupt gzip stream"));
        }
        result.insert(result.end(), chunk, chunk + (sizeof(chunk) - strm.avail_out));
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            return Result<std::vector<uint8_t>>::err(archive_error("truncated gzip stream"));
        }
    }
    inflateEnd(&strm);

    return Result<std::vector<uint8_t>>::ok(std::move(result));
}

// ============================================================================
// Filesystem Helpers
// ============================================================================

Result<std::string> read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(archive_error("failed to read file: " + path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::err(archive_error("failed to read file: " + path.string()));
    }
    return Result<std::string>::ok(ss.str());
}

Result<std::string> read_link(const fs::path& path) {
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) {
        return Result<std::string>::err(archive_error(
            "can't find symlink " + path.string() + ": " + ec.message()));
    }
    return Result<std::string>::ok(target.generic_string());
}

std::string relative_name(const fs::path& path, const fs::path& root) {
    std::string name = path.lexically_relative(root).generic_string();
    while (!name.empty() && name[0] == '/') {
        name.erase(0, 1);
    }
    return name;
}

} // namespace

// ============================================================================
// Archive Encoding / Decoding
// ============================================================================

Result<std::vector<uint8_t>> write_archive(const std::vector<ArchiveEntry>& entries) {
    std::vector<uint8_t> tar_data;

    for (const auto& entry : entries) {
        auto header = create_tar_header(entry);
        if (header.isErr()) {
            return Result<std::vector<uint8_t>>::err(header.error());
        }
        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header.value());
        tar_data.insert(tar_data.end(), header_bytes, header_bytes + TAR_BLOCK_SIZE);

        if (entry.kind == ArchiveEntryKind::Regular && !entry.data.empty()) {
            tar_data.insert(tar_data.end(), entry.data.begin(), entry.data.end());
            size_t padding = (TAR_BLOCK_SIZE - (entry.data.size() % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
            tar_data.insert(tar_data.end(), padding, 0);
        }
    }

    // Two empty blocks mark the end of the archive
    tar_data.insert(tar_data.end(), TAR_BLOCK_SIZE * 2, 0);

    return gzip_compress(tar_data);
}

Result<std::vector<ArchiveEntry>> read_archive(const std::vector<uint8_t>& archive_data) {
    auto decompressed = gzip_decompress(archive_data);
    if (decompressed.isErr()) {
        return Result<std::vector<ArchiveEntry>>::err(decompressed.error());
    }
    const std::vector<uint8_t>& tar_data = decompressed.value();

    std::vector<ArchiveEntry> entries;
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        bool empty = std::all_of(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                                 tar_data.begin() + static_cast<std::ptrdiff_t>(offset + TAR_BLOCK_SIZE),
                                 [](uint8_t b) { return b == 0; });
        if (empty) break;

        TarHeader header;
        std::memcpy(&header, tar_data.data() + offset, TAR_BLOCK_SIZE);
        offset += TAR_BLOCK_SIZE;

        if (parse_octal(header.chksum, TAR_CHKSUM_SIZE) != calculate_checksum(header)) {
            return Result<std::vector<ArchiveEntry>>::err(archive_error("tar header checksum mismatch"));
        }

        ArchiveEntry entry;
        std::string prefix = field_string(header.prefix, TAR_PREFIX_SIZE);
        entry.name = field_string(header.name, TAR_NAME_SIZE);
        if (!prefix.empty()) {
            entry.name = prefix + "/" + entry.name;
        }
        entry.mode = static_cast<uint32_t>(parse_octal(header.mode, TAR_MODE_SIZE));
        entry.mtime = static_cast<int64_t>(parse_octal(header.mtime, TAR_MTIME_SIZE));
        entry.size = parse_octal(header.size, TAR_SIZE_SIZE);

        switch (header.typeflag) {
            case TAR_REGTYPE:
            case TAR_AREGTYPE:
                entry.kind = ArchiveEntryKind::Regular;
                break;
            case TAR_SYMTYPE:
                entry.kind = ArchiveEntryKind::Symlink;
                entry.linkname = field_string(header.linkname, TAR_LINKNAME_SIZE);
                break;
            case TAR_DIRTYPE:
                entry.kind = ArchiveEntryKind::Directory;
                while (!entry.name.empty() && entry.name.back() == '/') {
                    entry.name.pop_back();
                }
                break;
            default:
                return Result<std::vector<ArchiveEntry>>::err(Error(ErrorCode::UNSUPPORTED_ENTRY,
                    "unsupported entry type '" + std::string(1, header.typeflag) + "': " + entry.name));
        }

        if (entry.kind == ArchiveEntryKind::Regular) {
            if (offset + entry.size > tar_data.size()) {
                return Result<std::vector<ArchiveEntry>>::err(archive_error("truncated archive: " + entry.name));
            }
            entry.data.assign(reinterpret_cast<const char*>(tar_data.data() + offset),
                              static_cast<size_t>(entry.size));
            size_t blocks = (static_cast<size_t>(entry.size) + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE;
            offset += blocks * TAR_BLOCK_SIZE;
        }

        entries.push_back(std::move(entry));
    }

    return Result<std::vector<ArchiveEntry>>::ok(std::move(entries));
}

// ============================================================================
// Archive Builder
// ============================================================================

Result<ArchiveResult> ArchiveBuilder::build(const std::string& descriptor_bytes) const {
    fs::path root(options_.root);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<ArchiveResult>::err(archive_error("bundle root is not a directory: " + options_.root));
    }

    auto rules = IgnoreRules::load(options_.root, options_.ignore_file);
    if (rules.isErr()) {
        return Result<ArchiveResult>::err(rules.error());
    }

    std::set<std::string> warned;
    auto ignored = [&](const std::string& name) {
        auto pattern = rules.value().match(name);
        if (!pattern) {
            return false;
        }
        if (warned.insert(*pattern).second) {
            emit_event(events_, EventKind::pattern_ignored, {{"pattern", *pattern}});
        }
        return true;
    };

    std::vector<ArchiveEntry> entries;
    bool descriptor_seen = false;

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Result<ArchiveResult>::err(archive_error(
            "can't walk " + options_.root + ": " + ec.message()));
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Result<ArchiveResult>::err(archive_error(
                "can't stat file in " + options_.root + ": " + ec.message()));
        }

        const fs::path& path = it->path();
        std::string name = relative_name(path, root);

        struct stat st;
        if (::lstat(path.c_str(), &st) != 0) {
            return Result<ArchiveResult>::err(archive_error(
                "can't stat file " + path.string() + ": " + std::strerror(errno)));
        }

        if (S_ISDIR(st.st_mode)) {
            if (options_.prune_excluded_directories && ignored(name)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        ArchiveEntry entry;
        entry.name = name;
        entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
        entry.mtime = static_cast<int64_t>(st.st_mtime);

        if (name == options_.descriptor_name) {
            entry.kind = ArchiveEntryKind::Regular;
            entry.data = descriptor_bytes;
            entry.size = descriptor_bytes.size();
            descriptor_seen = true;
            entries.push_back(std::move(entry));
            continue;
        }

        if (ignored(name)) {
            continue;
        }

        if (S_ISREG(st.st_mode)) {
            auto data = read_file_bytes(path);
            if (data.isErr()) {
                return Result<ArchiveResult>::err(data.error());
            }
            entry.kind = ArchiveEntryKind::Regular;
            entry.data = std::move(data.value());
            entry.size = entry.data.size();
        } else if (S_ISLNK(st.st_mode)) {
            auto target = read_link(path);
            if (target.isErr()) {
                return Result<ArchiveResult>::err(target.error());
            }
            entry.kind = ArchiveEntryKind::Symlink;
            entry.linkname = std::move(target.value());
            entry.size = 0;
        } else {
            return Result<ArchiveResult>::err(Error(ErrorCode::UNSUPPORTED_ENTRY,
                "can't archive non-regular entry: " + name));
        }

        entries.push_back(std::move(entry));
    }

    if (!descriptor_seen) {
        ArchiveEntry entry;
        entry.name = options_.descriptor_name;
        entry.kind = ArchiveEntryKind::Regular;
        entry.mode = 0644;
        entry.mtime = static_cast<int64_t>(std::time(nullptr));
        entry.data = descriptor_bytes;
        entry.size = descriptor_bytes.size();
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const ArchiveEntry& a, const ArchiveEntry& b) { return a.name < b.name; });

    auto archive = write_archive(entries);
    if (archive.isErr()) {
        return Result<ArchiveResult>::err(archive.error());
    }

    spdlog::debug("archived {} entries from {} ({} bytes)", entries.size(), options_.root,
                  archive.value().size());

    ArchiveResult result;
    result.data = std::move(archive.value());
    for (auto& entry : entries) {
        entry.data.clear();
        result.entries.push_back(std::move(entry));
    }
    return Result<ArchiveResult>::ok(std::move(result));
}

} // namespace stowage
