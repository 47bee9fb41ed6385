#include "core/staging_dir.hpp"
#include "core/update_error.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

StagingDir::StagingDir(const std::string& base, const std::string& prefix) {
    fs::path root;
    if (base.empty()) {
        std::error_code ec;
        root = fs::temp_directory_path(ec);
        if (ec) root = "/tmp";
    } else {
        root = base;
        std::error_code ec;
        fs::create_directories(root, ec);
    }

    std::string tmpl = (root / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        int err = errno;
        throw UpdateError(UpdateErrorKind::PermissionError,
                          "cannot create staging directory in " + root.string() + ": " +
                              std::strerror(err));
    }
    path_ = buf.data();
}

StagingDir::~StagingDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}
