#pragma once

#include "core/binary_installer.hpp"
#include "core/downloader.hpp"
#include "core/platform.hpp"
#include "core/release_client.hpp"
#include "core/update_error.hpp"
#include "net/http_fetch.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct AppConfig;

enum class UpdateState {
    Idle,
    CheckingVersion,
    UpToDate,  // terminal
    Resolving,
    Downloading,
    Extracting,
    Installing,
    Done,      // terminal
    Failed     // terminal
};

const char* to_string(UpdateState state);

struct UpdateOptions {
    std::string api_base = "https://api.github.com";
    std::string repo;
    std::string asset_prefix;
    std::string binary_name;
    std::string current_version;     // version of the running binary
    std::string install_path;        // "" = the running executable
    std::string staging_dir;         // "" = system temp directory
    HttpOptions http;
    std::optional<PlatformInfo> platform;  // unset = detect at run time
    BinaryInstaller::RenameFn rename;      // unset = std::filesystem::rename

    static UpdateOptions from_config(const AppConfig& config);
};

struct UpdateInfo {
    bool available = false;
    std::string latest_version;
    std::string current_version;
    std::string changelog;
};

struct UpdateResult {
    bool success = false;
    UpdateState status = UpdateState::Idle;  // terminal state reached
    std::string message;
    std::string current_version;
    std::string latest_version;

    // Failure details
    std::optional<UpdateErrorKind> error;
    int http_status = 0;
    std::vector<std::string> asset_names;  // NoMatchingAsset only

    // Success details
    std::string asset_name;
    std::string installed_path;
    BinaryInstaller::Strategy strategy = BinaryInstaller::Strategy::AtomicRename;
};

/// Runs one self-update attempt:
///   CheckingVersion -> UpToDate
///                   -> Resolving -> Downloading -> Extracting -> Installing -> Done
/// Any failure ends in Failed with the staging directory removed and the
/// installed binary untouched. Nothing is retried.
class Updater {
public:
    using StateFn = std::function<void(UpdateState)>;

    explicit Updater(UpdateOptions options);

    /// Compare the latest release tag with the running version.
    /// Throws UpdateError{RegistryUnavailable | MalformedRelease}.
    UpdateInfo check_for_update() const;

    /// Download and apply a self-update (replace current binary)
    UpdateResult apply_self_update(const StateFn& on_state = nullptr,
                                   const Downloader::ProgressFn& on_progress = nullptr) const;

    const UpdateOptions& options() const { return options_; }

private:
    UpdateOptions options_;
};
