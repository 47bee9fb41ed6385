#include "core/version.hpp"

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

#include <regex>
#include <vector>

std::string Version::current() {
    return APP_VERSION;
}

std::string Version::strip_prefix(const std::string& ver) {
    if (!ver.empty() && (ver[0] == 'v' || ver[0] == 'V')) {
        return ver.substr(1);
    }
    return ver;
}

bool Version::same_release(const std::string& a, const std::string& b) {
    return strip_prefix(a) == strip_prefix(b);
}

bool Version::is_development_build(const std::string& ver) {
    std::string v = strip_prefix(ver);
    return v.empty() || v == "dev" || v == "0.0.0";
}

bool Version::is_newer(const std::string& local_version, const std::string& remote_version) {
    // Find the version pattern: vX.Y.Z or X.Y.Z
    auto parse = [](const std::string& ver) -> std::vector<int> {
        std::vector<int> parts;
        std::regex re(R"(v?(\d+)\.(\d+)\.(\d+))");
        std::smatch match;
        if (std::regex_search(ver, match, re)) {
            for (size_t i = 1; i < match.size(); ++i) {
                try {
                    parts.push_back(std::stoi(match[i].str()));
                } catch (const std::out_of_range&) {
                    parts.push_back(0);
                }
            }
        }
        return parts;
    };

    auto local_parts = parse(local_version);
    auto remote_parts = parse(remote_version);

    // If we can't parse either, assume not newer
    if (local_parts.empty() || remote_parts.empty()) {
        return false;
    }

    for (size_t i = 0; i < 3; ++i) {
        if (remote_parts[i] > local_parts[i]) return true;
        if (remote_parts[i] < local_parts[i]) return false;
    }
    return false;
}
