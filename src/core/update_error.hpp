#pragma once

#include <stdexcept>
#include <string>
#include <vector>

enum class UpdateErrorKind {
    RegistryUnavailable,
    MalformedRelease,
    UnsupportedPlatform,
    NoMatchingAsset,
    DownloadFailed,
    TransportError,
    ArchiveFormatError,
    BinaryNotFoundInArchive,
    PermissionError,
    InstallFailed
};

/// Stable name of an error kind, e.g. "NoMatchingAsset"
const char* to_string(UpdateErrorKind kind);

/// Typed failure raised by every stage of the update pipeline.
/// what() returns "<KindName>: <detail>".
class UpdateError : public std::runtime_error {
public:
    UpdateError(UpdateErrorKind kind, const std::string& detail);

    /// DownloadFailed / RegistryUnavailable with the offending HTTP status
    static UpdateError http_status(UpdateErrorKind kind, int status, const std::string& url);

    /// NoMatchingAsset carrying every asset name the release offered
    static UpdateError no_matching_asset(const std::string& detail,
                                         std::vector<std::string> asset_names);

    UpdateErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    int status_code() const { return status_code_; }
    const std::vector<std::string>& asset_names() const { return asset_names_; }

private:
    UpdateErrorKind kind_;
    std::string detail_;
    int status_code_ = 0;
    std::vector<std::string> asset_names_;
};
