#include "stowage/archive.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace stowage {

std::string clean_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    bool rooted = path[0] == '/';
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        std::string part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (part.empty() || part == ".") {
            // Skip
        } else if (part == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(part);
            }
        } else {
            parts.push_back(part);
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) out += '/';
        out += parts[i];
    }
    if (out.empty()) {
        out = ".";
    }
    return out;
}

std::vector<std::string> read_ignore_patterns(std::istream& in) {
    std::vector<std::string> patterns;
    std::string line;
    bool first = true;

    while (std::getline(in, line)) {
        // UTF-8 byte order mark on the first line
        if (first && line.rfind("\xEF\xBB\xBF", 0) == 0) {
            line = line.substr(3);
        }
        first = false;

        if (line.rfind("#", 0) == 0) {
            continue;
        }

        auto begin = line.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = line.find_last_not_of(" \t\r\n");
        std::string pattern = line.substr(begin, end - begin + 1);

        if (pattern[0] == '!') {
            spdlog::warn("exception pattern '{}' is not supported and is skipped", pattern);
            continue;
        }

        std::replace(pattern.begin(), pattern.end(), '\\', '/');
        pattern = clean_path(pattern);
        if (pattern.size() > 1 && pattern[0] == '/') {
            pattern = pattern.substr(1);
        }
        patterns.push_back(pattern);
    }
    return patterns;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return ::fnmatch(pattern.c_str(), path.c_str(), FNM_PATHNAME) == 0;
}

Result<IgnoreRules> IgnoreRules::load(const std::string& root, const std::string& ignore_file) {
    fs::path ignore_path = fs::path(root) / ignore_file;

    std::error_code ec;
    if (!fs::exists(ignore_path, ec)) {
        return Result<IgnoreRules>::ok(IgnoreRules());
    }

    std::ifstream file(ignore_path);
    if (!file) {
        return Result<IgnoreRules>::err(Error(ErrorCode::ARCHIVE_ERROR,
            "failed to read ignore file: " + ignore_path.string()));
    }

    auto patterns = read_ignore_patterns(file);
    patterns.push_back(ignore_file);
    return Result<IgnoreRules>::ok(IgnoreRules(std::move(patterns)));
}

std::optional<std::string> IgnoreRules::match(const std::string& relative_path) const {
    for (const auto& pattern : patterns_) {
        if (glob_match(pattern, relative_path)) {
            return pattern;
        }
    }
    return std::nullopt;
}

} // namespace stowage
