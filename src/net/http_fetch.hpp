#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

struct HttpOptions {
    int connect_timeout_sec = 10;
    int read_timeout_sec = 60;
    std::string user_agent = "fifi";
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/// Thin blocking GET helpers over cpp-httplib. Connection level failures
/// (DNS, refused, TLS, timeout) throw UpdateError{TransportError}; any HTTP
/// status is returned to the caller to interpret.
class HttpFetch {
public:
    struct UrlParts {
        std::string scheme;
        std::string host;
        int port = 443;
        std::string path;
    };

    /// Split "scheme://host[:port]/path". Empty host on malformed input.
    static UrlParts parse_url(const std::string& url);

    static bool is_success(int status) { return status >= 200 && status < 300; }

    /// GET the whole body into memory
    static HttpResponse get(const std::string& url, const HttpOptions& options);

    /// GET and stream a 2xx body into `out`. Returns the final status; on a
    /// non-2xx status nothing is written.
    /// on_progress receives (bytes_received, total_bytes); total_bytes may be 0 if unknown
    static int get_to_stream(const std::string& url,
                             const HttpOptions& options,
                             std::ostream& out,
                             const std::function<void(int64_t received, int64_t total)>& on_progress = nullptr);
};
