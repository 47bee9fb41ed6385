#include "core/binary_installer.hpp"
#include "core/update_error.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// POSIX helpers
// ════════════════════════════════════════════════════════════════

/// Closes a file descriptor on scope exit
class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() {
        if (fd_ >= 0) ::close(fd_);
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    /// Close explicitly so a failing close() is reported
    bool close() {
        int fd = fd_;
        fd_ = -1;
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_;
};

static std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

/// Copy every byte of `source` into `out_fd` and fsync it
static void copy_bytes(const fs::path& source, int out_fd, std::error_code& ec) {
    Fd in(::open(source.c_str(), O_RDONLY));
    if (!in.valid()) {
        ec = last_error();
        return;
    }

    std::vector<char> buf(64 * 1024);
    for (;;) {
        ssize_t got = ::read(in.get(), buf.data(), buf.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            ec = last_error();
            return;
        }
        if (got == 0) break;

        ssize_t off = 0;
        while (off < got) {
            ssize_t put = ::write(out_fd, buf.data() + off, static_cast<size_t>(got - off));
            if (put < 0) {
                if (errno == EINTR) continue;
                ec = last_error();
                return;
            }
            off += put;
        }
    }

    if (::fsync(out_fd) != 0) {
        ec = last_error();
    }
}

static mode_t mode_of(const fs::path& path, std::error_code& ec) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        ec = last_error();
        return 0755;
    }
    return st.st_mode & 07777;
}

static bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied ||
           ec == std::errc::operation_not_permitted ||
           ec == std::errc::read_only_file_system;
}

// ════════════════════════════════════════════════════════════════
// BinaryInstaller
// ════════════════════════════════════════════════════════════════

BinaryInstaller::BinaryInstaller(RenameFn rename, CopyFn copy)
    : rename_(std::move(rename)), copy_(std::move(copy)) {
    if (!rename_) {
        rename_ = [](const fs::path& from, const fs::path& to, std::error_code& ec) {
            fs::rename(from, to, ec);
        };
    }
    if (!copy_) {
        copy_ = copy_bytes;
    }
}

const char* BinaryInstaller::to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::AtomicRename: return "atomic rename";
        case Strategy::StagedCopy:   return "staged copy";
        case Strategy::InPlaceCopy:  return "in-place copy";
    }
    return "unknown";
}

fs::path BinaryInstaller::self_path() {
#ifdef __APPLE__
    char raw_path[4096];
    uint32_t size = sizeof(raw_path);
    if (_NSGetExecutablePath(raw_path, &size) != 0) {
        throw UpdateError(UpdateErrorKind::InstallFailed,
                          "could not determine path of current binary");
    }
    return resolve_install_target(raw_path);
#else
    // Linux: /proc/self/exe is a symlink to the running binary
    return resolve_install_target("/proc/self/exe");
#endif
}

fs::path BinaryInstaller::resolve_install_target(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        throw UpdateError(UpdateErrorKind::InstallFailed,
                          "cannot resolve install target " + path.string() + ": " + ec.message());
    }
    if (!fs::is_regular_file(resolved, ec)) {
        throw UpdateError(UpdateErrorKind::InstallFailed,
                          "install target " + resolved.string() + " is not a regular file");
    }
    return resolved;
}

BinaryInstaller::Report BinaryInstaller::install(const ExtractedBinary& binary,
                                                 const fs::path& target) const {
    Report report;
    report.target = resolve_install_target(target);

    std::error_code ec;
    fs::permissions(binary.path,
                    fs::perms::owner_all |
                        fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw UpdateError(UpdateErrorKind::PermissionError,
                          "failed to make " + binary.path.string() + " executable: " + ec.message());
    }

    rename_(binary.path, report.target, ec);
    if (!ec) {
        report.strategy = Strategy::AtomicRename;
        return report;
    }

    // Commonly EXDEV (staging dir on another filesystem) or ETXTBSY
    report.strategy = install_by_copy(binary.path, report.target);
    return report;
}

BinaryInstaller::Strategy BinaryInstaller::install_by_copy(const fs::path& source,
                                                           const fs::path& target) const {
    std::error_code staged_ec;
    if (try_staged_copy(source, target, staged_ec)) {
        std::error_code ec;
        fs::remove(source, ec);
        return Strategy::StagedCopy;
    }

    std::error_code copy_ec;
    bool truncated = false;
    copy_in_place(source, target, copy_ec, truncated);
    if (!copy_ec) {
        std::error_code ec;
        fs::remove(source, ec);
        return Strategy::InPlaceCopy;
    }

    std::string detail = "failed to replace " + target.string() +
                         " (staged copy: " + staged_ec.message() +
                         "; in-place copy: " + copy_ec.message() + ")";
    if (truncated) {
        detail += "; " + target.string() + " was partially rewritten and must be reinstalled";
    }
    if (is_permission_error(staged_ec) && is_permission_error(copy_ec)) {
        throw UpdateError(UpdateErrorKind::PermissionError, detail);
    }
    throw UpdateError(UpdateErrorKind::InstallFailed, detail);
}

bool BinaryInstaller::try_staged_copy(const fs::path& source,
                                      const fs::path& target,
                                      std::error_code& ec) const {
    mode_t mode = mode_of(source, ec);
    if (ec) return false;

    std::string tmpl = (target.parent_path() / ("." + target.filename().string() + ".new-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    Fd out(::mkstemp(buf.data()));
    if (!out.valid()) {
        ec = last_error();
        return false;
    }
    const fs::path sibling(buf.data());

    auto discard = [&]() {
        std::error_code ignored;
        fs::remove(sibling, ignored);
    };

    copy_(source, out.get(), ec);
    if (!ec && ::fchmod(out.get(), mode) != 0) {
        ec = last_error();
    }
    if (!ec && !out.close()) {
        ec = last_error();
    }
    if (ec) {
        discard();
        return false;
    }

    rename_(sibling, target, ec);
    if (ec) {
        discard();
        return false;
    }
    return true;
}

void BinaryInstaller::copy_in_place(const fs::path& source,
                                    const fs::path& target,
                                    std::error_code& ec,
                                    bool& truncated) const {
    mode_t mode = mode_of(source, ec);
    if (ec) return;

    Fd out(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0755));
    if (!out.valid()) {
        ec = last_error();
        return;
    }
    truncated = true;

    copy_(source, out.get(), ec);
    if (ec) return;

    if (::fchmod(out.get(), mode) != 0) {
        ec = last_error();
        return;
    }
    if (!out.close()) {
        ec = last_error();
    }
}
