#include "net/http_fetch.hpp"
#include "core/update_error.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

static httplib::Headers make_headers(const HttpOptions& options) {
    httplib::Headers headers = {
        {"User-Agent", options.user_agent},
    };
    for (const auto& h : options.headers) {
        headers.emplace(h.first, h.second);
    }
    return headers;
}

template <typename Client>
static void configure(Client& cli, const HttpOptions& options) {
    cli.set_connection_timeout(options.connect_timeout_sec, 0);
    cli.set_read_timeout(options.read_timeout_sec, 0);
    cli.set_write_timeout(options.connect_timeout_sec, 0);
    cli.set_follow_location(true);
}

/// Run `fn` against a plain or TLS client depending on the URL scheme
template <typename Fn>
static httplib::Result with_client(const HttpFetch::UrlParts& parts, const HttpOptions& options, Fn&& fn) {
    if (parts.scheme == "https") {
        httplib::SSLClient cli(parts.host, parts.port);
        configure(cli, options);
        return fn(cli);
    }
    httplib::Client cli(parts.host, parts.port);
    configure(cli, options);
    return fn(cli);
}

static HttpFetch::UrlParts require_url(const std::string& url) {
    auto parts = HttpFetch::parse_url(url);
    if (parts.host.empty() || (parts.scheme != "http" && parts.scheme != "https")) {
        throw UpdateError(UpdateErrorKind::TransportError, "invalid URL '" + url + "'");
    }
    return parts;
}

HttpFetch::UrlParts HttpFetch::parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        return parts;
    }

    parts.scheme = url.substr(0, pos);
    auto rest = url.substr(pos + 3);
    auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        parts.host = rest.substr(0, path_pos);
        parts.path = rest.substr(path_pos);
    } else {
        parts.host = rest;
        parts.path = "/";
    }

    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        try {
            parts.port = std::stoi(parts.host.substr(colon + 1));
        } catch (const std::exception&) {
            parts.host.clear();
            return parts;
        }
        parts.host = parts.host.substr(0, colon);
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

HttpResponse HttpFetch::get(const std::string& url, const HttpOptions& options) {
    auto parts = require_url(url);
    auto headers = make_headers(options);

    auto res = with_client(parts, options, [&](auto& cli) {
        return cli.Get(parts.path, headers);
    });

    if (!res) {
        throw UpdateError(UpdateErrorKind::TransportError,
                          "GET " + url + " failed: " + httplib::to_string(res.error()));
    }

    HttpResponse response;
    response.status = res->status;
    response.body = std::move(res->body);
    return response;
}

int HttpFetch::get_to_stream(const std::string& url,
                             const HttpOptions& options,
                             std::ostream& out,
                             const std::function<void(int64_t, int64_t)>& on_progress) {
    auto parts = require_url(url);
    auto headers = make_headers(options);

    int status = 0;
    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    bool write_failed = false;

    auto response_handler = [&](const httplib::Response& response) -> bool {
        status = response.status;
        if (response.has_header("Content-Length")) {
            try {
                total_bytes = std::stoll(response.get_header_value("Content-Length"));
            } catch (const std::exception&) {
                total_bytes = 0;
            }
        }
        // Stop before any body byte is written for a non-2xx status
        return is_success(response.status);
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        out.write(data, static_cast<std::streamsize>(data_length));
        if (!out.good()) {
            write_failed = true;
            return false;
        }
        received_bytes += static_cast<int64_t>(data_length);
        if (on_progress) {
            on_progress(received_bytes, total_bytes);
        }
        return true;
    };

    auto res = with_client(parts, options, [&](auto& cli) {
        return cli.Get(parts.path, headers, response_handler, content_receiver);
    });

    if (write_failed) {
        throw UpdateError(UpdateErrorKind::TransportError,
                          "failed writing downloaded data from " + url);
    }
    if (status != 0 && !is_success(status)) {
        return status;
    }
    if (!res) {
        throw UpdateError(UpdateErrorKind::TransportError,
                          "GET " + url + " failed: " + httplib::to_string(res.error()));
    }
    return res->status;
}
