#pragma once

#include <string>

struct AppConfig {
    // Release registry
    std::string api_base = "https://api.github.com";
    std::string repo = "dscv103/fionacode";

    // Release assets
    std::string asset_prefix = "fifi";  // "<prefix>_<version>_<os>_<arch>.tar.gz"
    std::string binary_name = "fifi";   // executable inside the archive, without ".exe"

    // Staging ("" = system temp directory)
    std::string staging_dir;

    // Network
    int connect_timeout_sec = 10;
    int read_timeout_sec = 60;

    // Update notifier
    bool notify = true;
    int notify_timeout_sec = 3;
};

class Config {
public:
    Config();
    ~Config();

    /// Load config.yaml; false if missing or unparsable (defaults are kept)
    bool load();
    bool save();

    /// Load from an explicit file instead of config_path()
    bool load_from(const std::string& path);
    bool save_to(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    /// $FIFI_CONFIG when set, else <config_dir>/config.yaml
    static std::string config_path();
    static std::string expand_home(const std::string& path);

    /// FIFI_NO_UPDATE_CHECK set to a non-empty value
    static bool notifier_disabled_by_env();

private:
    AppConfig config_;
};
