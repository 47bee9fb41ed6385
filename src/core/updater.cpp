#include "core/updater.hpp"
#include "core/archive_extractor.hpp"
#include "core/asset_matcher.hpp"
#include "core/config.hpp"
#include "core/staging_dir.hpp"
#include "core/version.hpp"

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

const char* to_string(UpdateState state) {
    switch (state) {
        case UpdateState::Idle:            return "Idle";
        case UpdateState::CheckingVersion: return "CheckingVersion";
        case UpdateState::UpToDate:        return "UpToDate";
        case UpdateState::Resolving:       return "Resolving";
        case UpdateState::Downloading:     return "Downloading";
        case UpdateState::Extracting:      return "Extracting";
        case UpdateState::Installing:      return "Installing";
        case UpdateState::Done:            return "Done";
        case UpdateState::Failed:          return "Failed";
    }
    return "Unknown";
}

/// Error kind for an unexpected exception escaping a stage
static UpdateErrorKind kind_for_stage(UpdateState stage) {
    switch (stage) {
        case UpdateState::CheckingVersion: return UpdateErrorKind::RegistryUnavailable;
        case UpdateState::Resolving:       return UpdateErrorKind::NoMatchingAsset;
        case UpdateState::Downloading:     return UpdateErrorKind::TransportError;
        case UpdateState::Extracting:      return UpdateErrorKind::ArchiveFormatError;
        default:                           return UpdateErrorKind::InstallFailed;
    }
}

UpdateOptions UpdateOptions::from_config(const AppConfig& config) {
    UpdateOptions options;
    options.api_base = config.api_base;
    options.repo = config.repo;
    options.asset_prefix = config.asset_prefix;
    options.binary_name = config.binary_name;
    options.current_version = Version::current();
    options.staging_dir = config.staging_dir;
    options.http.connect_timeout_sec = config.connect_timeout_sec;
    options.http.read_timeout_sec = config.read_timeout_sec;
    options.http.user_agent = config.binary_name + "/" + Version::current();
    return options;
}

// ════════════════════════════════════════════════════════════════
// Updater implementation
// ════════════════════════════════════════════════════════════════

Updater::Updater(UpdateOptions options) : options_(std::move(options)) {
    if (options_.current_version.empty()) {
        options_.current_version = Version::current();
    }
}

UpdateInfo Updater::check_for_update() const {
    UpdateInfo info;
    info.current_version = Version::strip_prefix(options_.current_version);

    ReleaseClient client(options_.api_base, options_.repo, options_.http);
    ReleaseInfo release = client.fetch_latest_release();

    info.latest_version = Version::strip_prefix(release.tag);
    info.changelog = release.changelog;
    info.available = !Version::same_release(info.current_version, release.tag);
    return info;
}

UpdateResult Updater::apply_self_update(const StateFn& on_state,
                                        const Downloader::ProgressFn& on_progress) const {
    UpdateResult result;
    result.current_version = Version::strip_prefix(options_.current_version);

    UpdateState stage = UpdateState::Idle;
    auto enter = [&](UpdateState next) {
        stage = next;
        result.status = next;
        if (on_state) on_state(next);
    };

    auto fail = [&](UpdateErrorKind kind, const std::string& message) {
        result.success = false;
        result.error = kind;
        result.message = message;
        enter(UpdateState::Failed);
    };

    try {
        // Step 1: Compare the latest tag with the running version
        enter(UpdateState::CheckingVersion);
        ReleaseClient client(options_.api_base, options_.repo, options_.http);
        ReleaseInfo release = client.fetch_latest_release();
        result.latest_version = Version::strip_prefix(release.tag);

        if (Version::same_release(result.current_version, release.tag)) {
            result.success = true;
            result.message = "Already up to date (v" + result.current_version + ")";
            enter(UpdateState::UpToDate);
            return result;
        }

        // Step 2: Pick the asset built for this platform
        enter(UpdateState::Resolving);
        PlatformInfo platform = options_.platform ? *options_.platform : Platform::detect();
        AssetMatcher matcher(options_.asset_prefix);
        AssetInfo asset = matcher.select_asset(release, platform);
        result.asset_name = asset.name;

        // Everything below lives in the staging directory, removed on every exit path
        std::optional<StagingDir> staging;

        // Step 3: Download into the staging directory
        enter(UpdateState::Downloading);
        staging.emplace(options_.staging_dir, options_.binary_name + "-update");
        Downloader downloader(options_.http);
        StagedArchive archive = downloader.download(asset, staging->path(), on_progress);

        // Step 4: Unpack the executable
        enter(UpdateState::Extracting);
        const std::string expected = Platform::executable_name(options_.binary_name, platform);
        auto extractor = ArchiveExtractor::for_kind(archive.kind);
        ExtractedBinary binary =
            extractor->extract_binary(archive, expected, staging->file("extracted-" + expected));

        // Step 5: Replace the installed binary
        enter(UpdateState::Installing);
        fs::path target = options_.install_path.empty()
                              ? BinaryInstaller::self_path()
                              : fs::path(options_.install_path);
        BinaryInstaller installer(options_.rename);
        BinaryInstaller::Report report = installer.install(binary, target);

        result.installed_path = report.target.string();
        result.strategy = report.strategy;
        result.success = true;
        result.message = "Updated to v" + result.latest_version;
        enter(UpdateState::Done);
    } catch (const UpdateError& e) {
        result.http_status = e.status_code();
        result.asset_names = e.asset_names();
        fail(e.kind(), e.what());
    } catch (const fs::filesystem_error& e) {
        UpdateErrorKind kind = (e.code() == std::errc::permission_denied)
                                   ? UpdateErrorKind::PermissionError
                                   : kind_for_stage(stage);
        fail(kind, std::string(to_string(kind)) + ": " + e.what());
    } catch (const std::exception& e) {
        UpdateErrorKind kind = kind_for_stage(stage);
        fail(kind, std::string(to_string(kind)) + ": " + e.what());
    }

    return result;
}
