#pragma once

#include "core/platform.hpp"
#include "core/release_client.hpp"

#include <functional>
#include <string>
#include <vector>

/// Picks the release asset built for a platform.
///
/// Matching runs in two passes. The first compares every candidate name
/// produced by the naming conventions (in order) case-insensitively against
/// every asset; the first hit wins. The second accepts the first asset, in
/// registry order, whose lowercased name contains an OS token and an
/// architecture token and whose extension has an extractor (side files and
/// packages such as .deb or .tar.xz are skipped).
class AssetMatcher {
public:
    struct NameParts {
        std::string prefix;                    // "fifi"
        std::string version;                   // without the 'v' prefix
        std::string os;                        // one OS token ("linux", "macOS")
        std::string arch;                      // canonical token ("amd64")
        std::vector<std::string> legacy_arch;  // older spellings ("x86_64")
    };

    /// One naming scheme; returns its candidate names, most preferred first
    using NamingConvention = std::function<std::vector<std::string>(const NameParts&)>;

    explicit AssetMatcher(std::string prefix,
                          std::vector<NamingConvention> conventions = default_conventions());

    /// Current scheme first, then the historical ones
    static std::vector<NamingConvention> default_conventions();

    /// <prefix>_<ver>_<os>_<arch>.tar.gz / .zip, with and without the 'v'
    static std::vector<std::string> current_convention(const NameParts& parts);

    /// <Prefix>_<Os>_<legacy arch>, bare or as .tar.gz / .zip
    static std::vector<std::string> legacy_convention(const NameParts& parts);

    /// Append a convention after the existing ones
    void add_convention(NamingConvention convention);

    /// Ordered, de-duplicated candidate names for a release tag
    std::vector<std::string> candidate_names(const std::string& tag, const PlatformInfo& platform) const;

    /// Throws UpdateError{NoMatchingAsset} listing every asset name when
    /// neither pass finds a match
    AssetInfo select_asset(const ReleaseInfo& release, const PlatformInfo& platform) const;

private:
    std::string prefix_;
    std::vector<NamingConvention> conventions_;
};
