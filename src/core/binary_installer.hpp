#pragma once

#include "core/archive_extractor.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

/// Replaces the installed executable with an extracted one.
///
/// The target is only ever written through rename(2) or, when renaming is
/// impossible, through the copy fallback:
///   1. AtomicRename  rename(extracted, target)
///   2. StagedCopy    copy into a sibling temp file, then rename it over the target
///   3. InPlaceCopy   truncate and rewrite the target (not atomic)
/// Permission bits of the extracted binary end up on the target in every branch.
class BinaryInstaller {
public:
    enum class Strategy { AtomicRename, StagedCopy, InPlaceCopy };

    using RenameFn = std::function<void(const std::filesystem::path& from,
                                        const std::filesystem::path& to,
                                        std::error_code& ec)>;

    /// Writes every byte of a file into an open descriptor and syncs it
    using CopyFn = std::function<void(const std::filesystem::path& source,
                                      int out_fd,
                                      std::error_code& ec)>;

    struct Report {
        std::filesystem::path target;  // symlink-free path that was replaced
        Strategy strategy = Strategy::AtomicRename;
    };

    explicit BinaryInstaller(RenameFn rename = nullptr, CopyFn copy = nullptr);

    /// Absolute, symlink-free path of the running executable.
    /// Throws UpdateError{InstallFailed} if it cannot be determined.
    static std::filesystem::path self_path();

    /// Follow every symlink to the real file.
    /// Throws UpdateError{InstallFailed} if the target does not exist.
    static std::filesystem::path resolve_install_target(const std::filesystem::path& path);

    /// Resolve `target` once, mark `binary` executable and put it in place.
    /// Throws UpdateError{PermissionError} or UpdateError{InstallFailed}
    /// only after every strategy has failed; the target is then unchanged
    /// unless the in-place copy was interrupted, which the error detail says.
    Report install(const ExtractedBinary& binary, const std::filesystem::path& target) const;

    /// Steps 2 and 3 on their own; `target` must already be resolved.
    /// Removes `source` on success.
    Strategy install_by_copy(const std::filesystem::path& source,
                             const std::filesystem::path& target) const;

    static const char* to_string(Strategy strategy);

private:
    bool try_staged_copy(const std::filesystem::path& source,
                         const std::filesystem::path& target,
                         std::error_code& ec) const;

    void copy_in_place(const std::filesystem::path& source,
                       const std::filesystem::path& target,
                       std::error_code& ec,
                       bool& truncated) const;

    RenameFn rename_;
    CopyFn copy_;
};
