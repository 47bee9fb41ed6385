#include <gtest/gtest.h>
#include "core/binary_installer.hpp"
#include "core/update_error.hpp"
#include "test_support.hpp"

#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

class BinaryInstallerTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path target;
    fs::path extracted;

    const std::string old_bytes = "#!/bin/sh\necho old\n";
    const std::string new_bytes = "#!/bin/sh\necho new version\n";

    void SetUp() override {
        dir = test_support::unique_dir("install");
        fs::create_directories(dir / "bin");
        fs::create_directories(dir / "staging");

        target = dir / "bin" / "fifi";
        test_support::write_file(target, old_bytes);
        fs::permissions(target, fs::perms::owner_all, fs::perm_options::replace);

        extracted = dir / "staging" / "fifi.extracted";
        test_support::write_file(extracted, new_bytes);
        fs::permissions(extracted, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    ExtractedBinary binary() const {
        return ExtractedBinary{extracted, new_bytes.size()};
    }

    static BinaryInstaller::RenameFn failing_rename(std::errc err, int* calls = nullptr) {
        return [err, calls](const fs::path&, const fs::path&, std::error_code& ec) {
            if (calls) ++*calls;
            ec = std::make_error_code(err);
        };
    }

    static BinaryInstaller::CopyFn failing_copy(std::errc err, const std::string& partial = "",
                                                int* calls = nullptr) {
        return [err, partial, calls](const fs::path&, int out_fd, std::error_code& ec) {
            if (calls) ++*calls;
            if (!partial.empty()) {
                EXPECT_EQ(::write(out_fd, partial.data(), partial.size()),
                          static_cast<ssize_t>(partial.size()));
            }
            ec = std::make_error_code(err);
        };
    }

    void expect_no_siblings() const {
        for (const auto& entry : fs::directory_iterator(dir / "bin")) {
            EXPECT_EQ(entry.path().filename(), "fifi");
        }
    }
};

TEST_F(BinaryInstallerTest, ResolveFollowsSymlinks) {
    fs::create_symlink(target, dir / "link1");
    fs::create_symlink(dir / "link1", dir / "link2");
    EXPECT_EQ(BinaryInstaller::resolve_install_target(dir / "link2"), fs::canonical(target));
}

TEST_F(BinaryInstallerTest, ResolveMissingTargetFails) {
    try {
        BinaryInstaller::resolve_install_target(dir / "nope");
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::InstallFailed);
    }
}

TEST_F(BinaryInstallerTest, ResolveDirectoryFails) {
    try {
        BinaryInstaller::resolve_install_target(dir / "bin");
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::InstallFailed);
    }
}

TEST_F(BinaryInstallerTest, SelfPathIsRegularFile) {
    auto self = BinaryInstaller::self_path();
    EXPECT_TRUE(self.is_absolute());
    EXPECT_TRUE(fs::is_regular_file(self));
}

TEST_F(BinaryInstallerTest, AtomicRename) {
    BinaryInstaller installer;
    auto report = installer.install(binary(), target);

    EXPECT_EQ(report.strategy, BinaryInstaller::Strategy::AtomicRename);
    EXPECT_EQ(report.target, fs::canonical(target));
    EXPECT_EQ(test_support::read_file(target), new_bytes);
    EXPECT_TRUE(test_support::is_executable(target));
    EXPECT_FALSE(fs::exists(extracted));
}

TEST_F(BinaryInstallerTest, InstallThroughSymlinkReplacesRealFile) {
    fs::path link = dir / "fifi-link";
    fs::create_symlink(target, link);

    BinaryInstaller installer;
    auto report = installer.install(binary(), link);

    EXPECT_EQ(report.target, fs::canonical(target));
    EXPECT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(test_support::read_file(target), new_bytes);
    EXPECT_EQ(test_support::read_file(link), new_bytes);
}

TEST_F(BinaryInstallerTest, CrossDeviceFallsBackToStagedCopy) {
    // First rename (extracted -> target) fails with EXDEV; the sibling rename succeeds
    int calls = 0;
    BinaryInstaller installer([&calls](const fs::path& from, const fs::path& to, std::error_code& ec) {
        if (++calls == 1) {
            ec = std::make_error_code(std::errc::cross_device_link);
            return;
        }
        fs::rename(from, to, ec);
    });

    auto report = installer.install(binary(), target);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(report.strategy, BinaryInstaller::Strategy::StagedCopy);
    EXPECT_EQ(test_support::read_file(target), new_bytes);
    EXPECT_TRUE(test_support::is_executable(target));
    EXPECT_FALSE(fs::exists(extracted));

    // No stray sibling temp files
    for (const auto& entry : fs::directory_iterator(dir / "bin")) {
        EXPECT_EQ(entry.path().filename(), "fifi");
    }
}

TEST_F(BinaryInstallerTest, RenameUnavailableFallsBackToInPlaceCopy) {
    int calls = 0;
    BinaryInstaller installer(failing_rename(std::errc::cross_device_link, &calls));

    auto report = installer.install(binary(), target);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(report.strategy, BinaryInstaller::Strategy::InPlaceCopy);
    EXPECT_EQ(test_support::read_file(target), new_bytes);
    EXPECT_TRUE(test_support::is_executable(target));

    auto mode = fs::status(target).permissions();
    EXPECT_EQ(mode & fs::perms::all,
              fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                  fs::perms::others_read | fs::perms::others_exec);
    for (const auto& entry : fs::directory_iterator(dir / "bin")) {
        EXPECT_EQ(entry.path().filename(), "fifi");
    }
}

TEST_F(BinaryInstallerTest, InstallByCopyCopiesModeBits) {
    fs::permissions(extracted, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);

    BinaryInstaller installer;
    auto strategy = installer.install_by_copy(extracted, fs::canonical(target));

    EXPECT_EQ(strategy, BinaryInstaller::Strategy::StagedCopy);
    EXPECT_EQ(test_support::read_file(target), new_bytes);
    EXPECT_EQ(fs::status(target).permissions() & fs::perms::all,
              fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    EXPECT_FALSE(fs::exists(extracted));
}

TEST_F(BinaryInstallerTest, MissingTargetLeavesBinaryInStaging) {
    BinaryInstaller installer;
    try {
        installer.install(binary(), dir / "bin" / "missing");
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::InstallFailed);
    }
    EXPECT_TRUE(fs::exists(extracted));
    EXPECT_EQ(test_support::read_file(target), old_bytes);
}

TEST_F(BinaryInstallerTest, ReadOnlyDirectoryIsPermissionError) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: root ignores directory permissions";

    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
    fs::permissions(dir / "bin", fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    BinaryInstaller installer(failing_rename(std::errc::permission_denied));
    try {
        installer.install(binary(), target);
        ADD_FAILURE() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::PermissionError);
    }

    fs::permissions(dir / "bin", fs::perms::owner_all, fs::perm_options::replace);
    EXPECT_EQ(test_support::read_file(target), old_bytes);
}

TEST_F(BinaryInstallerTest, DeniedCopyIsPermissionError) {
    int copies = 0;
    BinaryInstaller installer(failing_rename(std::errc::permission_denied),
                              failing_copy(std::errc::permission_denied, "", &copies));
    try {
        installer.install(binary(), target);
        ADD_FAILURE() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::PermissionError);
    }
    EXPECT_EQ(copies, 2);
    EXPECT_TRUE(fs::exists(extracted));
    expect_no_siblings();
}

TEST_F(BinaryInstallerTest, InterruptedInPlaceCopyIsReported) {
    BinaryInstaller installer(failing_rename(std::errc::cross_device_link),
                              failing_copy(std::errc::io_error, "#!/bin"));
    try {
        installer.install(binary(), target);
        ADD_FAILURE() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::InstallFailed);
        EXPECT_NE(std::string(e.what()).find("partially rewritten and must be reinstalled"), std::string::npos)
            << e.what();
    }
    EXPECT_EQ(test_support::read_file(target), "#!/bin");
    EXPECT_TRUE(fs::exists(extracted));
    expect_no_siblings();
}

TEST_F(BinaryInstallerTest, StrategyNames) {
    EXPECT_STREQ(BinaryInstaller::to_string(BinaryInstaller::Strategy::AtomicRename), "atomic rename");
    EXPECT_STREQ(BinaryInstaller::to_string(BinaryInstaller::Strategy::StagedCopy), "staged copy");
    EXPECT_STREQ(BinaryInstaller::to_string(BinaryInstaller::Strategy::InPlaceCopy), "in-place copy");
}
