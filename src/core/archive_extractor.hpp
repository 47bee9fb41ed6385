#pragma once

#include "core/downloader.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

/// Unpacked executable bytes; execute bits are applied by the installer
struct ExtractedBinary {
    std::filesystem::path path;
    uint64_t size = 0;
};

/// Pulls one executable out of a staged release asset.
///
/// Only the base name of an entry is compared with `expected_name`, so the
/// binary may sit at any depth inside the archive. The first regular file
/// that matches wins. A full scan without a match throws
/// UpdateError{BinaryNotFoundInArchive}; a damaged container throws
/// UpdateError{ArchiveFormatError}. `dest` never survives a failure.
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    virtual ExtractedBinary extract_binary(const StagedArchive& archive,
                                           const std::string& expected_name,
                                           const std::filesystem::path& dest) const = 0;

    /// Extractor for an archive kind
    static std::unique_ptr<ArchiveExtractor> for_kind(ArchiveKind kind);

    /// "dir/sub/fifi" -> "fifi" (both '/' and '\\' separate)
    static std::string base_name(const std::string& entry_name);
};

/// gzip-compressed tar (ustar, GNU long names, PAX path records)
class TarGzExtractor : public ArchiveExtractor {
public:
    ExtractedBinary extract_binary(const StagedArchive& archive,
                                   const std::string& expected_name,
                                   const std::filesystem::path& dest) const override;
};

/// zip read through libarchive
class ZipExtractor : public ArchiveExtractor {
public:
    ExtractedBinary extract_binary(const StagedArchive& archive,
                                   const std::string& expected_name,
                                   const std::filesystem::path& dest) const override;
};

/// Asset that is the executable itself
class RawExtractor : public ArchiveExtractor {
public:
    ExtractedBinary extract_binary(const StagedArchive& archive,
                                   const std::string& expected_name,
                                   const std::filesystem::path& dest) const override;
};
