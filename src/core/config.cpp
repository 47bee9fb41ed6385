#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/fifi";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/fifi";
}

std::string Config::config_path() {
    const char* override_path = std::getenv("FIFI_CONFIG");
    if (override_path && *override_path) {
        return expand_home(override_path);
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::notifier_disabled_by_env() {
    const char* v = std::getenv("FIFI_NO_UPDATE_CHECK");
    return v && *v;
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::save() {
    return save_to(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto update = root["update"]) {
            loaded.api_base = update["api_base"].as<std::string>(loaded.api_base);
            loaded.repo = update["repo"].as<std::string>(loaded.repo);
            loaded.asset_prefix = update["asset_prefix"].as<std::string>(loaded.asset_prefix);
            loaded.binary_name = update["binary_name"].as<std::string>(loaded.binary_name);
            loaded.staging_dir = expand_home(update["staging_dir"].as<std::string>(loaded.staging_dir));
            loaded.connect_timeout_sec = update["connect_timeout_sec"].as<int>(loaded.connect_timeout_sec);
            loaded.read_timeout_sec = update["read_timeout_sec"].as<int>(loaded.read_timeout_sec);
            loaded.notify = update["notify"].as<bool>(loaded.notify);
            loaded.notify_timeout_sec = update["notify_timeout_sec"].as<int>(loaded.notify_timeout_sec);
        }
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        std::cerr << "fifi: ignoring invalid config " << path << ": " << e.what() << "\n";
        return false;
    }

    config_ = loaded;
    return true;
}

bool Config::save_to(const std::string& path) {
    if (path.empty()) return false;

    try {
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "update" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "api_base" << YAML::Value << config_.api_base;
        out << YAML::Key << "repo" << YAML::Value << config_.repo;
        out << YAML::Key << "asset_prefix" << YAML::Value << config_.asset_prefix;
        out << YAML::Key << "binary_name" << YAML::Value << config_.binary_name;
        out << YAML::Key << "staging_dir" << YAML::Value << config_.staging_dir;
        out << YAML::Key << "connect_timeout_sec" << YAML::Value << config_.connect_timeout_sec;
        out << YAML::Key << "read_timeout_sec" << YAML::Value << config_.read_timeout_sec;
        out << YAML::Key << "notify" << YAML::Value << config_.notify;
        out << YAML::Key << "notify_timeout_sec" << YAML::Value << config_.notify_timeout_sec;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str() << "\n";
        return fout.good();
    } catch (const fs::filesystem_error& e) {
        std::cerr << "fifi: cannot write config " << path << ": " << e.what() << "\n";
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
