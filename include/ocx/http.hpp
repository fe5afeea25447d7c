#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// HTTP Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
    std::string content_type;
    bool timed_out = false;
};

// Read-only HTTP GET. Registry traffic goes through this seam so tests can
// serve documents from memory.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // ok is false for transport failures and for non-2xx responses; in the
    // latter case http_status carries the response code.
    virtual FetchResult get(const std::string& url) = 0;
};

struct CurlOptions {
    long connect_timeout_seconds = 15;
    long total_timeout_seconds = 120;
    std::string user_agent = "ocx/1.0";
};

// libcurl transport. Follows redirects, verifies TLS peer and host, and
// refuses anything but https:// URLs.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(CurlOptions options = {});

    FetchResult get(const std::string& url) override;

private:
    CurlOptions options_;
};

// True when url uses the https:// scheme
bool is_https_url(const std::string& url);

} // namespace ocx
