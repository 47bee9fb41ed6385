#include "core/asset_matcher.hpp"
#include "core/downloader.hpp"
#include "core/update_error.hpp"
#include "core/version.hpp"

#include <algorithm>
#include <cctype>

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string capitalize(std::string s) {
    if (!s.empty()) {
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    }
    return s;
}

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Checksum and signature files sit next to the archives in a release
static bool is_side_file(const std::string& lower_name) {
    static const char* const markers[] = {".sha256", ".sha512", "checksum", ".sig", ".asc", ".pem", ".sbom"};
    for (const char* m : markers) {
        if (contains(lower_name, m)) return true;
    }
    return false;
}

// ════════════════════════════════════════════════════════════════
// Naming conventions
// ════════════════════════════════════════════════════════════════

std::vector<std::string> AssetMatcher::current_convention(const NameParts& p) {
    std::vector<std::string> names;
    for (const std::string& ver : {p.version, "v" + p.version}) {
        std::string stem = p.prefix + "_" + ver + "_" + p.os + "_" + p.arch;
        names.push_back(stem + ".tar.gz");
        names.push_back(stem + ".zip");
    }
    return names;
}

std::vector<std::string> AssetMatcher::legacy_convention(const NameParts& p) {
    std::vector<std::string> names;
    for (const auto& arch : p.legacy_arch) {
        std::string stem = p.prefix + "_" + capitalize(p.os) + "_" + arch;
        names.push_back(stem);
        names.push_back(stem + ".tar.gz");
        names.push_back(stem + ".zip");
    }
    return names;
}

std::vector<AssetMatcher::NamingConvention> AssetMatcher::default_conventions() {
    return {&AssetMatcher::current_convention, &AssetMatcher::legacy_convention};
}

// ════════════════════════════════════════════════════════════════
// AssetMatcher
// ════════════════════════════════════════════════════════════════

AssetMatcher::AssetMatcher(std::string prefix, std::vector<NamingConvention> conventions)
    : prefix_(std::move(prefix)), conventions_(std::move(conventions)) {}

void AssetMatcher::add_convention(NamingConvention convention) {
    conventions_.push_back(std::move(convention));
}

std::vector<std::string> AssetMatcher::candidate_names(const std::string& tag,
                                                       const PlatformInfo& platform) const {
    NameParts parts;
    parts.prefix = prefix_;
    parts.version = Version::strip_prefix(tag);
    parts.arch = Platform::arch_name(platform.arch);
    parts.legacy_arch = Platform::legacy_arch_tokens(platform.arch);

    std::vector<std::string> names;
    for (const auto& convention : conventions_) {
        for (const auto& os : Platform::os_tokens(platform.os)) {
            parts.os = os;
            for (auto& name : convention(parts)) {
                if (std::find(names.begin(), names.end(), name) == names.end()) {
                    names.push_back(std::move(name));
                }
            }
        }
    }
    return names;
}

AssetInfo AssetMatcher::select_asset(const ReleaseInfo& release, const PlatformInfo& platform) const {
    // Pass 1: exact (case-insensitive) candidate names, candidate order wins
    for (const auto& candidate : candidate_names(release.tag, platform)) {
        for (const auto& asset : release.assets) {
            if (iequals(asset.name, candidate)) {
                return asset;
            }
        }
    }

    // Pass 2: OS token + architecture token anywhere in the name, registry order wins.
    // Only assets the extractors can unpack qualify.
    std::vector<std::string> os_tokens;
    for (const auto& os : Platform::os_tokens(platform.os)) {
        os_tokens.push_back(to_lower(os));
    }
    std::vector<std::string> arch_tokens = {to_lower(Platform::arch_name(platform.arch))};
    for (const auto& arch : Platform::legacy_arch_tokens(platform.arch)) {
        arch_tokens.push_back(to_lower(arch));
    }

    for (const auto& asset : release.assets) {
        std::string lower = to_lower(asset.name);
        if (is_side_file(lower) || !Downloader::archive_kind_for(asset.name)) continue;

        bool os_hit = std::any_of(os_tokens.begin(), os_tokens.end(),
                                  [&](const std::string& t) { return contains(lower, t); });
        bool arch_hit = std::any_of(arch_tokens.begin(), arch_tokens.end(),
                                    [&](const std::string& t) { return contains(lower, t); });
        if (os_hit && arch_hit) {
            return asset;
        }
    }

    std::vector<std::string> names;
    names.reserve(release.assets.size());
    for (const auto& asset : release.assets) {
        names.push_back(asset.name);
    }
    throw UpdateError::no_matching_asset(
        "no matching asset for " + Platform::describe(platform) + " in release " + release.tag,
        std::move(names));
}
