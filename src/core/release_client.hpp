#pragma once

#include "net/http_fetch.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ── Data structures ────────────────────────────────────────────

struct AssetInfo {
    std::string name;
    std::string download_url;
    int64_t size = 0;  // bytes, 0 when the registry omits it
};

struct ReleaseInfo {
    std::string tag;  // e.g. "v0.3.0"
    std::string changelog;
    std::vector<AssetInfo> assets;  // registry order
};

// ── ReleaseClient ──────────────────────────────────────────────

/// Queries a GitHub-compatible release registry for the latest release.
class ReleaseClient {
public:
    ReleaseClient(std::string api_base, std::string repo, HttpOptions http = {});

    /// GET <api_base>/repos/<repo>/releases/latest.
    /// Throws UpdateError{RegistryUnavailable} on transport failure or a
    /// non-2xx status, UpdateError{MalformedRelease} on an unusable body.
    ReleaseInfo fetch_latest_release() const;

    /// Parse a release JSON document. Unknown fields are ignored.
    static ReleaseInfo parse_release(const std::string& body);

    std::string latest_release_url() const;

private:
    std::string api_base_;
    std::string repo_;
    HttpOptions http_;
};
