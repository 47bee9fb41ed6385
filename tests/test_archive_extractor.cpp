#include <gtest/gtest.h>
#include "core/archive_extractor.hpp"
#include "core/update_error.hpp"
#include "test_support.hpp"

using test_support::ArchiveEntry;

namespace fs = std::filesystem;

class ArchiveExtractorTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path dest;
    const std::string binary = std::string("\x7f" "ELF\x02\x01\x01", 7) + std::string(5000, 'B') + "tail";

    void SetUp() override {
        dir = test_support::unique_dir("extract");
        fs::create_directories(dir);
        dest = dir / "fifi.extracted";
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    StagedArchive staged(const std::string& file, ArchiveKind kind) {
        return StagedArchive{dir / file, kind, file};
    }

    UpdateErrorKind extract_error(const StagedArchive& archive, const std::string& expected) {
        try {
            ArchiveExtractor::for_kind(archive.kind)->extract_binary(archive, expected, dest);
        } catch (const UpdateError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected UpdateError";
        return UpdateErrorKind::InstallFailed;
    }
};

TEST_F(ArchiveExtractorTest, BaseName) {
    EXPECT_EQ(ArchiveExtractor::base_name("fifi"), "fifi");
    EXPECT_EQ(ArchiveExtractor::base_name("fifi_0.3.0/bin/fifi"), "fifi");
    EXPECT_EQ(ArchiveExtractor::base_name("dist\\fifi.exe"), "fifi.exe");
    EXPECT_EQ(ArchiveExtractor::base_name("dir/"), "dir");
}

// ── tar.gz ──────────────────────────────────────────────────

TEST_F(ArchiveExtractorTest, TarGzTopLevel) {
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{"README.md", "docs"}, {"fifi", binary}});

    auto out = ArchiveExtractor::for_kind(ArchiveKind::TarGz)->extract_binary(archive, "fifi", dest);
    EXPECT_EQ(out.path, dest);
    EXPECT_EQ(out.size, binary.size());
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzNested) {
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{"fifi_0.3.0_linux_amd64/", "", '5'},
                                             {"fifi_0.3.0_linux_amd64/LICENSE", "MIT"},
                                             {"fifi_0.3.0_linux_amd64/bin/fifi", binary}});

    TarGzExtractor extractor;
    extractor.extract_binary(archive, "fifi", dest);
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzLongName) {
    std::string deep = std::string(120, 'd') + "/fifi";
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{deep, binary}});

    TarGzExtractor extractor;
    extractor.extract_binary(archive, "fifi", dest);
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzSimilarNamesDoNotMatch) {
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{"fifi.sha256", "abc"}, {"fifi-helper", "x"}, {"fifi/", "", '5'}});

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::BinaryNotFoundInArchive);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, TarGzReadmeOnly) {
    auto archive = staged("fifi_0.3.0_linux_amd64.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{"README.md", "# fifi"}});

    try {
        TarGzExtractor().extract_binary(archive, "fifi", dest);
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::BinaryNotFoundInArchive);
        EXPECT_NE(std::string(e.what()).find("fifi_0.3.0_linux_amd64.tar.gz"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, TarGzGarbage) {
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_file(archive.path, std::string(2048, 'x'));

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, TarGzTruncatedEntryLeavesNoOutput) {
    std::string tar = test_support::make_tar({{"fifi", binary}});
    tar.resize(512 + 1024);  // header plus part of the body
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, TarGzBadChecksum) {
    std::string tar = test_support::make_tar({{"fifi", binary}});
    tar[0] = 'g';  // header no longer matches its checksum
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
}

TEST_F(ArchiveExtractorTest, TarGzPaxPathNamesNextEntry) {
    using test_support::pad512;
    using test_support::tar_header;
    std::string records = test_support::pax_record("mtime", "1700000000.5") +
                          test_support::pax_record("path", std::string(150, 'p') + "/bin/fifi");
    std::string tar = tar_header("PaxHeaders/x", records.size(), 'x') + pad512(records) +
                      tar_header("truncated-nam", binary.size(), '0') + pad512(binary) +
                      std::string(1024, '\0');
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    TarGzExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzGlobalPaxHeaderIsSkipped) {
    using test_support::pad512;
    using test_support::tar_header;
    std::string records = test_support::pax_record("path", "fifi");
    std::string tar = tar_header("pax_global_header", records.size(), 'g') + pad512(records) +
                      tar_header("README.md", 4, '0') + pad512("docs") +
                      std::string(1024, '\0');
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::BinaryNotFoundInArchive);
}

TEST_F(ArchiveExtractorTest, TarGzUstarPrefix) {
    using test_support::pad512;
    using test_support::tar_header;
    std::string tar = tar_header("LICENSE", 3, '0', "fifi_0.3.0_linux_amd64/share") + pad512("MIT") +
                      tar_header("fifi", binary.size(), '0', "fifi_0.3.0_linux_amd64/bin") + pad512(binary) +
                      std::string(1024, '\0');
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    auto out = TarGzExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(out.size, binary.size());
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzBase256Size) {
    using test_support::pad512;
    using test_support::tar_header;
    // The README's size is binary-encoded; misreading it would desync the stream
    std::string tar = tar_header("README.md", 700, '0', "", true) + pad512(std::string(700, 'r')) +
                      tar_header("fifi", binary.size(), '0', "", true) + pad512(binary) +
                      std::string(1024, '\0');
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::write_gzip(archive.path, tar);

    auto out = TarGzExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(out.size, binary.size());
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, TarGzSymlinkIsNotTheBinary) {
    auto archive = staged("a.tar.gz", ArchiveKind::TarGz);
    test_support::make_tar_gz(archive.path, {{"bin/fifi", "", '2'}, {"README.md", "docs"}});

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::BinaryNotFoundInArchive);
}

// ── zip ─────────────────────────────────────────────────────

TEST_F(ArchiveExtractorTest, ZipDeflated) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::make_zip(archive.path, {{"fifi_0.3.0_windows_amd64/", ""},
                                          {"fifi_0.3.0_windows_amd64/README.md", "docs"},
                                          {"fifi_0.3.0_windows_amd64/fifi.exe", binary}});

    auto out = ArchiveExtractor::for_kind(ArchiveKind::Zip)->extract_binary(archive, "fifi.exe", dest);
    EXPECT_EQ(out.size, binary.size());
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, ZipStored) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::make_zip(archive.path, {{"fifi", binary}}, false);

    ZipExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, ZipReadmeOnly) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::make_zip(archive.path, {{"README.md", "# fifi"}});

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::BinaryNotFoundInArchive);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, ZipGarbage) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::write_file(archive.path, "this is not a zip archive at all, just text");

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
}

TEST_F(ArchiveExtractorTest, ZipEncryptedEntryIsFormatError) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::make_zip(archive.path, {{"fifi", binary}}, false, 0x0001);

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, ZipCorruptDataFailsCrc) {
    auto archive = staged("a.zip", ArchiveKind::Zip);
    test_support::make_zip(archive.path, {{"fifi", binary}}, false);

    // Flip a byte inside the stored payload (after the 30-byte local header and name)
    std::string bytes = test_support::read_file(archive.path);
    bytes[30 + 4 + 100] ^= 0x5a;
    test_support::write_file(archive.path, bytes);

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}

// ── raw ─────────────────────────────────────────────────────

TEST_F(ArchiveExtractorTest, RawCopiesBytes) {
    auto archive = staged("fifi_Linux_x86_64", ArchiveKind::Raw);
    test_support::write_file(archive.path, binary);

    auto out = RawExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(out.size, binary.size());
    EXPECT_EQ(test_support::read_file(dest), binary);
}

TEST_F(ArchiveExtractorTest, RawAcceptsScript) {
    auto archive = staged("fifi_Darwin_x86_64", ArchiveKind::Raw);
    test_support::write_file(archive.path, "#!/bin/sh\necho fifi\n");

    RawExtractor().extract_binary(archive, "fifi", dest);
    EXPECT_EQ(test_support::read_file(dest), "#!/bin/sh\necho fifi\n");
}

TEST_F(ArchiveExtractorTest, RawRejectsNonExecutable) {
    auto archive = staged("fifi_Linux_x86_64", ArchiveKind::Raw);
    test_support::write_file(archive.path, "!<arch>\ndebian-binary   1342943816  0     0     100644  4");

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ArchiveExtractorTest, RawEmptyIsFormatError) {
    auto archive = staged("fifi_Linux_x86_64", ArchiveKind::Raw);
    test_support::write_file(archive.path, "");

    EXPECT_EQ(extract_error(archive, "fifi"), UpdateErrorKind::ArchiveFormatError);
    EXPECT_FALSE(fs::exists(dest));
}
