#pragma once

#include <filesystem>
#include <string>

/// Private per-attempt directory for downloaded and extracted files.
/// Created with mkdtemp(); removed recursively on destruction.
class StagingDir {
public:
    /// base empty = std::filesystem::temp_directory_path().
    /// Throws UpdateError{PermissionError} if the directory cannot be created.
    explicit StagingDir(const std::string& base = "", const std::string& prefix = "fifi-update");
    ~StagingDir();

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /// Path of a file inside the staging directory
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};
