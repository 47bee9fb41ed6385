#pragma once

#include "core/release_client.hpp"
#include "net/http_fetch.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

enum class ArchiveKind {
    TarGz,  // .tar.gz / .tgz
    Zip,    // .zip
    Raw     // no extension (or .exe): the asset is the executable itself
};

const char* to_string(ArchiveKind kind);

/// Downloaded asset bytes waiting to be unpacked
struct StagedArchive {
    std::filesystem::path path;
    ArchiveKind kind = ArchiveKind::TarGz;
    std::string asset_name;
};

class Downloader {
public:
    using ProgressFn = std::function<void(int64_t received, int64_t total)>;

    explicit Downloader(HttpOptions http = {});

    /// Archive kind from the asset's file name suffix (never from content).
    /// Empty for names carrying any other extension (.deb, .tar.xz, .msi).
    static std::optional<ArchiveKind> archive_kind_for(const std::string& asset_name);

    /// Stream the asset into `staging_dir`.
    /// Throws UpdateError{ArchiveFormatError} before any request when the
    /// asset name has an unsupported extension.
    /// Throws UpdateError{DownloadFailed} with the status on a non-2xx
    /// response and UpdateError{TransportError} when the connection fails.
    /// No file is left behind on failure.
    StagedArchive download(const AssetInfo& asset,
                           const std::filesystem::path& staging_dir,
                           const ProgressFn& on_progress = nullptr) const;

private:
    HttpOptions http_;
};
