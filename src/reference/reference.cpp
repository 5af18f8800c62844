#include "stowage/reference.hpp"

#include <algorithm>
#include <cctype>

namespace stowage {

// ============================================================================
// Grammar Helpers
// ============================================================================

namespace {

constexpr size_t NAME_TOTAL_LENGTH_MAX = 255;
constexpr size_t TAG_LENGTH_MAX = 128;

bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_hex_lower(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

// path-component := [a-z0-9]+ (separator [a-z0-9]+)*
// separator      := [_.] | __ | [-]*
bool is_valid_path_component(const std::string& comp) {
    if (comp.empty() || !is_lower_alnum(comp.front()) || !is_lower_alnum(comp.back())) {
        return false;
    }
    size_t i = 0;
    while (i < comp.size()) {
        if (is_lower_alnum(comp[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < comp.size() && !is_lower_alnum(comp[i])) {
            ++i;
        }
        std::string sep = comp.substr(start, i - start);
        bool dashes = std::all_of(sep.begin(), sep.end(), [](char c) { return c == '-'; });
        if (!(sep == "." || sep == "_" || sep == "__" || dashes)) {
            return false;
        }
    }
    return true;
}

// domain-component := [a-zA-Z0-9] | [a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9]
bool is_valid_domain_component(const std::string& comp) {
    if (comp.empty()) return false;
    auto alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
    if (!alnum(comp.front()) || !alnum(comp.back())) return false;
    return std::all_of(comp.begin(), comp.end(),
                       [&](char c) { return alnum(c) || c == '-'; });
}

bool is_valid_domain(const std::string& domain) {
    std::string host = domain;
    auto colon = domain.rfind(':');
    if (colon != std::string::npos) {
        std::string port = domain.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        host = domain.substr(0, colon);
    }
    size_t start = 0;
    while (true) {
        size_t dot = host.find('.', start);
        if (!is_valid_domain_component(host.substr(start, dot - start))) {
            return false;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

// tag := [\w][\w.-]{0,127}
bool is_valid_tag(const std::string& tag) {
    if (tag.empty() || tag.size() > TAG_LENGTH_MAX || !is_word_char(tag.front())) {
        return false;
    }
    return std::all_of(tag.begin(), tag.end(),
                       [](char c) { return is_word_char(c) || c == '.' || c == '-'; });
}

bool is_anonymous_identifier(const std::string& s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), is_hex_lower);
}

bool has_upper(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
                       [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; });
}

// The first component is a domain when it looks like a host: contains '.'
// or ':', is "localhost", or carries uppercase letters (which a path never
// may).
bool looks_like_domain(const std::string& first) {
    return first.find_first_of(".:") != std::string::npos ||
           first == "localhost" || has_upper(first);
}

Error reference_error(const std::string& reference, const std::string& why) {
    return Error(ErrorCode::REFERENCE_ERROR,
                 "invalid reference format (" + reference + "): " + why);
}

} // namespace

// ============================================================================
// ImageReference
// ============================================================================

std::string ImageReference::name() const {
    return domain + "/" + path;
}

std::string ImageReference::to_string() const {
    std::string out = name();
    if (tag) out += ":" + *tag;
    if (digest) out += "@" + *digest;
    return out;
}

std::string ImageReference::familiar() const {
    std::string out;
    if (domain == DEFAULT_DOMAIN) {
        std::string prefix = OFFICIAL_REPO_PREFIX;
        if (path.rfind(prefix, 0) == 0 && path.find('/', prefix.size()) == std::string::npos) {
            out = path.substr(prefix.size());
        } else {
            out = path;
        }
    } else {
        out = name();
    }
    if (tag) out += ":" + *tag;
    if (digest) out += "@" + *digest;
    return out;
}

ImageReference ImageReference::with_tag_default() const {
    ImageReference copy = *this;
    if (!copy.tag) {
        copy.tag = DEFAULT_TAG;
    }
    return copy;
}

ImageReference ImageReference::pinned(const std::string& digest_value) const {
    ImageReference copy = *this;
    copy.tag.reset();
    copy.digest = digest_value;
    return copy;
}

// ============================================================================
// Parsing
// ============================================================================

bool is_valid_digest(const std::string& digest) {
    auto colon = digest.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= digest.size()) {
        return false;
    }
    std::string algorithm = digest.substr(0, colon);
    std::string encoded = digest.substr(colon + 1);

    // algorithm := [a-z0-9]+ ([+._-][a-z0-9]+)*
    if (!is_lower_alnum(algorithm.front()) || !is_lower_alnum(algorithm.back())) {
        return false;
    }
    for (size_t i = 0; i < algorithm.size(); ++i) {
        char c = algorithm[i];
        if (is_lower_alnum(c)) continue;
        bool sep = c == '+' || c == '.' || c == '_' || c == '-';
        if (!sep || !is_lower_alnum(algorithm[i + 1])) return false;
    }

    if (algorithm == "sha256") {
        return encoded.size() == 64 && std::all_of(encoded.begin(), encoded.end(), is_hex_lower);
    }
    if (encoded.size() < 32) return false;
    return std::all_of(encoded.begin(), encoded.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '=' || c == '_' || c == '-';
    });
}

Result<ImageReference> parse_normalized_reference(const std::string& reference) {
    if (reference.empty()) {
        return Result<ImageReference>::err(reference_error(reference, "empty reference"));
    }
    if (is_anonymous_identifier(reference)) {
        return Result<ImageReference>::err(reference_error(
            reference, "cannot specify 64-byte hexadecimal strings"));
    }

    ImageReference ref;
    std::string remainder = reference;

    auto at = remainder.find('@');
    if (at != std::string::npos) {
        std::string digest = remainder.substr(at + 1);
        if (!is_valid_digest(digest)) {
            return Result<ImageReference>::err(reference_error(reference, "invalid digest"));
        }
        ref.digest = digest;
        remainder = remainder.substr(0, at);
    }

    auto last_colon = remainder.rfind(':');
    auto last_slash = remainder.rfind('/');
    if (last_colon != std::string::npos &&
        (last_slash == std::string::npos || last_colon > last_slash)) {
        std::string tag = remainder.substr(last_colon + 1);
        if (!is_valid_tag(tag)) {
            return Result<ImageReference>::err(reference_error(reference, "invalid tag"));
        }
        ref.tag = tag;
        remainder = remainder.substr(0, last_colon);
    }

    if (remainder.empty()) {
        return Result<ImageReference>::err(reference_error(reference, "missing repository name"));
    }

    auto first_slash = remainder.find('/');
    if (first_slash != std::string::npos && looks_like_domain(remainder.substr(0, first_slash))) {
        ref.domain = remainder.substr(0, first_slash);
        ref.path = remainder.substr(first_slash + 1);
    } else {
        ref.domain = DEFAULT_DOMAIN;
        ref.path = remainder;
    }

    if (ref.domain == LEGACY_DEFAULT_DOMAIN) {
        ref.domain = DEFAULT_DOMAIN;
    }
    if (ref.domain == DEFAULT_DOMAIN && ref.path.find('/') == std::string::npos) {
        ref.path = OFFICIAL_REPO_PREFIX + ref.path;
    }

    if (has_upper(ref.path)) {
        return Result<ImageReference>::err(reference_error(reference, "repository name must be lowercase"));
    }
    if (!is_valid_domain(ref.domain)) {
        return Result<ImageReference>::err(reference_error(reference, "invalid domain"));
    }

    size_t start = 0;
    while (true) {
        size_t slash = ref.path.find('/', start);
        if (!is_valid_path_component(ref.path.substr(start, slash - start))) {
            return Result<ImageReference>::err(reference_error(reference, "invalid repository path"));
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    if (ref.name().size() > NAME_TOTAL_LENGTH_MAX) {
        return Result<ImageReference>::err(reference_error(
            reference, "repository name must not be more than 255 characters"));
    }

    return Result<ImageReference>::ok(std::move(ref));
}

// ============================================================================
// Placeholder Shim
// ============================================================================

Result<std::string> expand_default_placeholder(const std::string& image) {
    if (image.empty() || image[0] != '$') {
        return Result<std::string>::ok(image);
    }

    if (image.size() < 3 || image[1] != '{' || image.back() != '}') {
        return Result<std::string>::err(Error(ErrorCode::REFERENCE_ERROR,
            "invalid image reference (" + image +
            "): expected the form ${variable-default}"));
    }

    std::string body = image.substr(2, image.size() - 3);
    auto dash = body.find('-');
    if (dash == std::string::npos) {
        return Result<std::string>::err(Error(ErrorCode::REFERENCE_ERROR,
            "invalid image reference (" + image +
            "): variable does not have a default value"));
    }

    std::string variable = body.substr(0, dash);
    if (!variable.empty() && variable.back() == ':') {
        variable.pop_back();
    }
    if (variable.empty()) {
        return Result<std::string>::err(Error(ErrorCode::REFERENCE_ERROR,
            "invalid image reference (" + image + "): missing variable name"));
    }

    return Result<std::string>::ok(body.substr(dash + 1));
}

} // namespace stowage
