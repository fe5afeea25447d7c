#include "ocx/http.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace ocx {

namespace {

// Callback for libcurl to write received data
size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
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

bool is_https_url(const std::string& url) {
    if (url.size() <= 8) return false;
    std::string scheme = url.substr(0, 8);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme == "https://";
}

CurlTransport::CurlTransport(CurlOptions options) : options_(std::move(options)) {}

FetchResult CurlTransport::get(const std::string& url) {
    FetchResult result;

    if (!is_https_url(url)) {
        result.error = "refusing non-https URL: " + url;
        return result;
    }

    // Ensure global initialization
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    spdlog::debug("GET {}", url);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // Follow redirects, but never off https
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https");
#else
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTPS);
#endif

    // TLS verification
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.total_timeout_seconds);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.timed_out = res == CURLE_OPERATION_TIMEDOUT;
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        result.content_type = content_type;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

} // namespace ocx
