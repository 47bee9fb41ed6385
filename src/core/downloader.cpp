#include "core/downloader.hpp"
#include "core/update_error.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

const char* to_string(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::TarGz: return "tar.gz";
        case ArchiveKind::Zip:   return "zip";
        case ArchiveKind::Raw:   return "raw";
    }
    return "unknown";
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Final '.' segment of a file name, when it looks like an extension.
/// Version dots ("fifi_0.3.0_linux_amd64") do not count.
static std::string extension_of(const std::string& lower) {
    auto dot = lower.rfind('.');
    if (dot == std::string::npos) return "";
    std::string ext = lower.substr(dot + 1);
    if (ext.empty() || ext.size() > 4) return "";
    bool alnum = std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
    bool alpha = std::any_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
    return (alnum && alpha) ? ext : "";
}

Downloader::Downloader(HttpOptions http) : http_(std::move(http)) {}

std::optional<ArchiveKind> Downloader::archive_kind_for(const std::string& asset_name) {
    std::string lower = asset_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ends_with(lower, ".tar.gz") || ends_with(lower, ".tgz")) {
        return ArchiveKind::TarGz;
    }
    if (ends_with(lower, ".zip")) {
        return ArchiveKind::Zip;
    }

    std::string ext = extension_of(lower);
    if (ext.empty() || ext == "exe") {
        return ArchiveKind::Raw;
    }
    return std::nullopt;
}

StagedArchive Downloader::download(const AssetInfo& asset,
                                   const fs::path& staging_dir,
                                   const ProgressFn& on_progress) const {
    auto kind = archive_kind_for(asset.name);
    if (!kind) {
        throw UpdateError(UpdateErrorKind::ArchiveFormatError,
                          asset.name + ": unsupported asset type");
    }

    StagedArchive staged;
    staged.kind = *kind;
    staged.asset_name = asset.name;

    switch (staged.kind) {
        case ArchiveKind::TarGz: staged.path = staging_dir / "download.tar.gz"; break;
        case ArchiveKind::Zip:   staged.path = staging_dir / "download.zip"; break;
        case ArchiveKind::Raw:   staged.path = staging_dir / "download.bin"; break;
    }

    std::ofstream out(staged.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw UpdateError(UpdateErrorKind::PermissionError,
                          "cannot create staging file " + staged.path.string());
    }

    auto discard = [&]() {
        out.close();
        std::error_code ec;
        fs::remove(staged.path, ec);
    };

    int status = 0;
    try {
        status = HttpFetch::get_to_stream(asset.download_url, http_, out, on_progress);
    } catch (const UpdateError&) {
        discard();
        throw;
    }

    if (!HttpFetch::is_success(status)) {
        discard();
        throw UpdateError::http_status(UpdateErrorKind::DownloadFailed, status, asset.download_url);
    }

    out.close();
    if (out.fail()) {
        discard();
        throw UpdateError(UpdateErrorKind::TransportError,
                          "failed to flush " + staged.path.string());
    }

    return staged;
}
