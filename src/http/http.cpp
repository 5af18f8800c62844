#include "stowage/http.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace stowage {

std::string HttpResponse::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

// ============================================================================
// libcurl Plumbing
// ============================================================================

namespace {

// Callback for libcurl to write received data
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// Collect response headers. A new status line (after a redirect) starts a
// fresh header set.
size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    size_t total = size * nmemb;
    std::string line(ptr, total);

    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    std::string value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t\r\n");
    value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);

    (*headers)[name] = value;
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

HttpResponse perform_request(const HttpRequest& request) {
    HttpResponse response;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        response.error = "failed to initialize CURL";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.user_agent.c_str());

    if (request.follow_redirects) {
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    }

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    if (!request.unix_socket.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, request.unix_socket.c_str());
    }

    if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list;
    for (const auto& h : request.headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), h.c_str());
        if (!appended) {
            response.error = "failed to build request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    spdlog::debug("{} {}", request.method, request.url);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = std::string("HTTP request failed: ") +
                         (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("{} {} -> {}", request.method, request.url, response.status);

    response.ok = true;
    return response;
}

std::string url_escape(const std::string& value) {
    static const char hex_chars[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex_chars[(c >> 4) & 0x0F]);
            out.push_back(hex_chars[c & 0x0F]);
        }
    }
    return out;
}

} // namespace stowage
