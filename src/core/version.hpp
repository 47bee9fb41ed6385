#pragma once

#include <string>

class Version {
public:
    /// Compiled-in version of the running binary (APP_VERSION)
    static std::string current();

    /// Strip a single leading 'v' / 'V' ("v1.2.3" -> "1.2.3")
    static std::string strip_prefix(const std::string& ver);

    /// True when both strings name the same release once the prefix is stripped
    static bool same_release(const std::string& a, const std::string& b);

    /// Builds that never nag about updates ("dev", "0.0.0", empty)
    static bool is_development_build(const std::string& ver);

    /// Compare version strings like "v1.18.0", returns true if remote is newer
    static bool is_newer(const std::string& local_version, const std::string& remote_version);
};
