#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/update_notifier.hpp"
#include "core/updater.hpp"
#include "core/version.hpp"

#include <cstring>
#include <iostream>
#include <unistd.h>

// ── Helpers ─────────────────────────────────────────────────

static void print_stage(UpdateState state, const std::string& binary) {
    switch (state) {
        case UpdateState::CheckingVersion:
            std::cout << "Checking for updates...\n";
            break;
        case UpdateState::Resolving:
            std::cout << "Selecting release asset for this platform...\n";
            break;
        case UpdateState::Downloading:
            std::cout << "Downloading update...\n";
            break;
        case UpdateState::Extracting:
            std::cout << "Extracting " << binary << "...\n";
            break;
        case UpdateState::Installing:
            std::cout << "Installing...\n";
            break;
        default:
            break;
    }
}

/// Run the notifier around a command; it never affects the exit code
template <typename Fn>
static int with_notifier(const Config& config, Fn&& fn) {
    const AppConfig& d = config.data();
    if (!d.notify || Config::notifier_disabled_by_env()) {
        return fn();
    }

    UpdateOptions options = UpdateOptions::from_config(d);
    options.http.connect_timeout_sec = d.notify_timeout_sec;
    options.http.read_timeout_sec = d.notify_timeout_sec;

    UpdateNotifier notifier(options);
    notifier.start();
    int ret = fn();
    notifier.finish(std::cerr);
    return ret;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        return cmd_help();
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }

    Config config;
    config.load();

    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version(config);
    }
    if (std::strcmp(cmd, "update") == 0) {
        return cmd_update(argc, argv, config);
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv, config);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'fifi help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "fifi - FionaCode CLI\n"
        "\n"
        "Usage:\n"
        "  fifi update [self]     Download and install the latest release\n"
        "  fifi update check      Show whether a newer release exists\n"
        "  fifi config [show]     Print the effective configuration\n"
        "  fifi config path       Print the configuration file path\n"
        "  fifi version           Show version\n"
        "  fifi help              Show this help\n"
        "\n"
        "Set FIFI_NO_UPDATE_CHECK=1 to disable the update notice.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version(const Config& config) {
    return with_notifier(config, [] {
        std::cout << "fifi version " << Version::current() << "\n";
        return 0;
    });
}

// ── update ──────────────────────────────────────────────────

int CLI::cmd_update(int argc, char* argv[], const Config& config) {
    std::string sub = "self";
    if (argc >= 3) {
        sub = argv[2];
    }

    if (sub == "self") {
        return update_self(config);
    }
    if (sub == "check") {
        return update_check(config);
    }

    std::cerr << "Unknown update command: " << sub << "\n";
    std::cerr << "Usage: fifi update [self|check]\n";
    return 1;
}

int CLI::update_self(const Config& config) {
    const AppConfig& d = config.data();
    Updater updater(UpdateOptions::from_config(d));

    const bool tty = isatty(STDOUT_FILENO) == 1;
    auto on_progress = [tty](int64_t received, int64_t total) {
        if (!tty || total <= 0) return;
        std::cout << "\r  " << (received * 100 / total) << "% (" << received / 1024 << " / "
                  << total / 1024 << " KiB)" << std::flush;
    };
    auto on_state = [&](UpdateState state) {
        if (tty && state == UpdateState::Extracting) std::cout << "\n";
        print_stage(state, d.binary_name);
    };

    UpdateResult result = updater.apply_self_update(on_state, on_progress);

    if (!result.success) {
        std::cerr << "Update failed: " << result.message << "\n";
        return 1;
    }

    if (result.status == UpdateState::UpToDate) {
        std::cout << result.message << "\n";
        return 0;
    }

    std::cout << "Current version: v" << result.current_version << "\n";
    std::cout << "Latest version:  v" << result.latest_version << "\n";
    if (result.strategy == BinaryInstaller::Strategy::InPlaceCopy) {
        std::cerr << "warning: " << result.installed_path
                  << " was rewritten in place (atomic replacement was not possible)\n";
    }
    std::cout << result.message << " (" << result.installed_path << ")\n";
    return 0;
}

int CLI::update_check(const Config& config) {
    Updater updater(UpdateOptions::from_config(config.data()));

    try {
        UpdateInfo info = updater.check_for_update();
        std::cout << "fifi: v" << info.current_version;
        if (info.available && Version::is_newer(info.latest_version, info.current_version)) {
            // Published release is older: `update` would downgrade to it
            std::cout << " -> v" << info.latest_version << " (published release is older)\n";
        } else if (info.available) {
            std::cout << " -> v" << info.latest_version << " (update available)\n";
        } else {
            std::cout << " (up to date)\n";
        }
        return 0;
    } catch (const UpdateError& e) {
        std::cerr << "Failed to check for updates: " << e.what() << "\n";
        return 1;
    }
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[], const Config& config) {
    std::string sub = "show";
    if (argc >= 3) {
        sub = argv[2];
    }

    if (sub == "path") {
        std::cout << Config::config_path() << "\n";
        return 0;
    }
    if (sub != "show") {
        std::cerr << "Unknown config command: " << sub << "\n";
        std::cerr << "Usage: fifi config [show|path]\n";
        return 1;
    }

    return with_notifier(config, [&config] {
        const AppConfig& d = config.data();
        std::cout << "api_base:            " << d.api_base << "\n"
                  << "repo:                " << d.repo << "\n"
                  << "asset_prefix:        " << d.asset_prefix << "\n"
                  << "binary_name:         " << d.binary_name << "\n"
                  << "staging_dir:         " << (d.staging_dir.empty() ? "(system temp)" : d.staging_dir) << "\n"
                  << "connect_timeout_sec: " << d.connect_timeout_sec << "\n"
                  << "read_timeout_sec:    " << d.read_timeout_sec << "\n"
                  << "notify:              " << (d.notify ? "true" : "false") << "\n"
                  << "notify_timeout_sec:  " << d.notify_timeout_sec << "\n";
        return 0;
    });
}
