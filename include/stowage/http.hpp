#pragma once

#include <map>
#include <string>
#include <vector>

namespace stowage {

// ============================================================================
// HTTP Transport (libcurl)
// ============================================================================

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    std::string unix_socket;            // Connect through this socket when set
    std::string user_agent = "stowage/1.0";
    bool follow_redirects = true;
};

struct HttpResponse {
    bool ok = false;                    // Transport succeeded (any status)
    std::string error;
    long status = 0;
    std::map<std::string, std::string> headers;   // Lowercased names
    std::string body;

    std::string header(const std::string& name) const;
    bool success() const { return ok && status >= 200 && status < 300; }
};

// Perform a blocking request. Timeouts are left to libcurl defaults.
HttpResponse perform_request(const HttpRequest& request);

// Percent-encode a string for use in a URL path segment or query value
std::string url_escape(const std::string& value);

} // namespace stowage
