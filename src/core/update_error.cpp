#include "core/update_error.hpp"

const char* to_string(UpdateErrorKind kind) {
    switch (kind) {
        case UpdateErrorKind::RegistryUnavailable:     return "RegistryUnavailable";
        case UpdateErrorKind::MalformedRelease:        return "MalformedRelease";
        case UpdateErrorKind::UnsupportedPlatform:     return "UnsupportedPlatform";
        case UpdateErrorKind::NoMatchingAsset:         return "NoMatchingAsset";
        case UpdateErrorKind::DownloadFailed:          return "DownloadFailed";
        case UpdateErrorKind::TransportError:          return "TransportError";
        case UpdateErrorKind::ArchiveFormatError:      return "ArchiveFormatError";
        case UpdateErrorKind::BinaryNotFoundInArchive: return "BinaryNotFoundInArchive";
        case UpdateErrorKind::PermissionError:         return "PermissionError";
        case UpdateErrorKind::InstallFailed:           return "InstallFailed";
    }
    return "Unknown";
}

UpdateError::UpdateError(UpdateErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(to_string(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

UpdateError UpdateError::http_status(UpdateErrorKind kind, int status, const std::string& url) {
    UpdateError err(kind, "HTTP " + std::to_string(status) + " from " + url);
    err.status_code_ = status;
    return err;
}

UpdateError UpdateError::no_matching_asset(const std::string& detail,
                                           std::vector<std::string> asset_names) {
    std::string full = detail + " (assets: ";
    for (size_t i = 0; i < asset_names.size(); ++i) {
        if (i > 0) full += ", ";
        full += asset_names[i];
    }
    full += ")";

    UpdateError err(UpdateErrorKind::NoMatchingAsset, full);
    err.asset_names_ = std::move(asset_names);
    return err;
}
