#include "core/archive_extractor.hpp"
#include "core/update_error.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// Shared helpers
// ════════════════════════════════════════════════════════════════

static constexpr size_t kChunkSize = 64 * 1024;

[[noreturn]] static void format_error(const StagedArchive& archive, const std::string& what) {
    throw UpdateError(UpdateErrorKind::ArchiveFormatError,
                      archive.asset_name + ": " + what);
}

[[noreturn]] static void not_found(const StagedArchive& archive, const std::string& expected_name) {
    throw UpdateError(UpdateErrorKind::BinaryNotFoundInArchive,
                      expected_name + " not found in " + archive.asset_name);
}

static std::ofstream open_output(const fs::path& dest) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw UpdateError(UpdateErrorKind::PermissionError,
                          "cannot create " + dest.string());
    }
    return out;
}

/// Removes `dest` unless released; keeps a half-written binary from escaping
class OutputGuard {
public:
    explicit OutputGuard(const fs::path& dest) : dest_(dest) {}
    ~OutputGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(dest_, ec);
        }
    }
    void release() { released_ = true; }

private:
    fs::path dest_;
    bool released_ = false;
};

// ── tar ─────────────────────────────────────────────────────────

static constexpr size_t kTarBlock = 512;

struct GzCloser {
    void operator()(gzFile_s* f) const {
        if (f) gzclose(f);
    }
};
using GzFile = std::unique_ptr<gzFile_s, GzCloser>;

/// Read exactly n bytes. Returns false on a clean EOF before the first byte.
static bool gz_read_exact(gzFile gz, const StagedArchive& archive, char* buf, size_t n) {
    size_t done = 0;
    while (done < n) {
        int got = gzread(gz, buf + done, static_cast<unsigned>(n - done));
        if (got < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz, &errnum);
            format_error(archive, std::string("gzip stream error: ") + (msg ? msg : "unknown"));
        }
        if (got == 0) {
            if (done == 0) return false;
            format_error(archive, "truncated tar stream");
        }
        done += static_cast<size_t>(got);
    }
    return true;
}

static std::string field_string(const char* field, size_t len) {
    return std::string(field, strnlen(field, len));
}

/// Numeric tar field: octal text, or GNU base-256 when the top bit is set
static uint64_t parse_tar_number(const char* field, size_t len, const StagedArchive& archive) {
    if (static_cast<unsigned char>(field[0]) & 0x80) {
        uint64_t value = static_cast<unsigned char>(field[0]) & 0x7f;
        for (size_t i = 1; i < len; ++i) {
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }

    uint64_t value = 0;
    size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < len && field[i] != '\0' && field[i] != ' '; ++i) {
        if (field[i] < '0' || field[i] > '7') {
            format_error(archive, "invalid numeric field in tar header");
        }
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

static bool is_zero_block(const char* block) {
    return std::all_of(block, block + kTarBlock, [](char c) { return c == '\0'; });
}

static bool checksum_ok(const char* block, const StagedArchive& archive) {
    uint64_t expected = parse_tar_number(block + 148, 8, archive);
    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < kTarBlock; ++i) {
        char c = (i >= 148 && i < 156) ? ' ' : block[i];
        unsigned_sum += static_cast<unsigned char>(c);
        signed_sum += static_cast<signed char>(c);
    }
    return expected == unsigned_sum || static_cast<int64_t>(expected) == signed_sum;
}

/// Read a whole entry body (long names, PAX records)
static std::string read_tar_body(gzFile gz, const StagedArchive& archive, uint64_t size) {
    if (size > (1u << 20)) {
        format_error(archive, "oversized tar metadata entry");
    }
    uint64_t padded = (size + kTarBlock - 1) / kTarBlock * kTarBlock;
    std::string body(static_cast<size_t>(padded), '\0');
    if (padded > 0 && !gz_read_exact(gz, archive, &body[0], static_cast<size_t>(padded))) {
        format_error(archive, "truncated tar stream");
    }
    body.resize(static_cast<size_t>(size));
    return body;
}

/// PAX extended header: records of "<len> <key>=<value>\n"
static std::string pax_path(const std::string& body) {
    std::string path;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t space = body.find(' ', pos);
        if (space == std::string::npos) break;
        size_t len = 0;
        try {
            len = static_cast<size_t>(std::stoul(body.substr(pos, space - pos)));
        } catch (const std::exception&) {
            break;
        }
        if (len == 0 || pos + len > body.size()) break;

        std::string record = body.substr(space + 1, len - (space - pos) - 2);
        auto eq = record.find('=');
        if (eq != std::string::npos && record.compare(0, eq, "path") == 0) {
            path = record.substr(eq + 1);
        }
        pos += len;
    }
    return path;
}

static void skip_tar_data(gzFile gz, const StagedArchive& archive, uint64_t size) {
    uint64_t remaining = (size + kTarBlock - 1) / kTarBlock * kTarBlock;
    std::vector<char> buf(kChunkSize);
    while (remaining > 0) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        if (!gz_read_exact(gz, archive, buf.data(), n)) {
            format_error(archive, "truncated tar stream");
        }
        remaining -= n;
    }
}

// ── raw ─────────────────────────────────────────────────────────

/// ELF, Mach-O (thin or fat), PE, or a script with a #! line
static bool looks_executable(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    char head[4] = {};
    in.read(head, sizeof(head));
    const std::string magic(head, static_cast<size_t>(in.gcount()));

    static const std::string known[] = {
        std::string("\x7f" "ELF", 4),
        std::string("\xfe\xed\xfa\xce", 4), std::string("\xce\xfa\xed\xfe", 4),
        std::string("\xfe\xed\xfa\xcf", 4), std::string("\xcf\xfa\xed\xfe", 4),
        std::string("\xca\xfe\xba\xbe", 4),
        "MZ", "#!",
    };
    for (const auto& m : known) {
        if (magic.size() >= m.size() && magic.compare(0, m.size(), m) == 0) return true;
    }
    return false;
}

// ── zip ─────────────────────────────────────────────────────────

struct ArchiveReadFree {
    void operator()(struct archive* a) const {
        if (a) archive_read_free(a);
    }
};
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadFree>;

static std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// ════════════════════════════════════════════════════════════════
// ArchiveExtractor
// ════════════════════════════════════════════════════════════════

std::unique_ptr<ArchiveExtractor> ArchiveExtractor::for_kind(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::TarGz: return std::make_unique<TarGzExtractor>();
        case ArchiveKind::Zip:   return std::make_unique<ZipExtractor>();
        case ArchiveKind::Raw:   return std::make_unique<RawExtractor>();
    }
    return nullptr;
}

std::string ArchiveExtractor::base_name(const std::string& entry_name) {
    std::string name = entry_name;
    while (!name.empty() && (name.back() == '/' || name.back() == '\\')) {
        name.pop_back();
    }
    auto pos = name.find_last_of("/\\");
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

// ════════════════════════════════════════════════════════════════
// TarGzExtractor
// ════════════════════════════════════════════════════════════════

ExtractedBinary TarGzExtractor::extract_binary(const StagedArchive& archive,
                                               const std::string& expected_name,
                                               const fs::path& dest) const {
    GzFile gz(gzopen(archive.path.string().c_str(), "rb"));
    if (!gz) {
        format_error(archive, "cannot open " + archive.path.string());
    }
    gzbuffer(gz.get(), static_cast<unsigned>(kChunkSize));

    std::array<char, kTarBlock> block{};
    std::string long_name;  // from a GNU 'L' or PAX 'x' entry, applies to the next header

    while (gz_read_exact(gz.get(), archive, block.data(), kTarBlock)) {
        if (is_zero_block(block.data())) {
            break;  // end-of-archive marker
        }
        if (!checksum_ok(block.data(), archive)) {
            format_error(archive, "tar header checksum mismatch");
        }

        const char type = block[156];
        const uint64_t size = parse_tar_number(block.data() + 124, 12, archive);

        if (type == 'L') {
            long_name = read_tar_body(gz.get(), archive, size);
            long_name.resize(strnlen(long_name.c_str(), long_name.size()));
            continue;
        }
        if (type == 'x') {
            std::string path = pax_path(read_tar_body(gz.get(), archive, size));
            if (!path.empty()) long_name = path;
            continue;
        }
        if (type == 'g') {
            skip_tar_data(gz.get(), archive, size);
            continue;
        }

        std::string name;
        if (!long_name.empty()) {
            name = long_name;
            long_name.clear();
        } else {
            name = field_string(block.data(), 100);
            if (std::memcmp(block.data() + 257, "ustar", 5) == 0) {
                std::string prefix = field_string(block.data() + 345, 155);
                if (!prefix.empty()) name = prefix + "/" + name;
            }
        }

        const bool regular = (type == '0' || type == '\0' || type == '7');
        if (!regular || base_name(name) != expected_name) {
            skip_tar_data(gz.get(), archive, size);
            continue;
        }

        OutputGuard guard(dest);
        std::ofstream out = open_output(dest);

        std::vector<char> buf(kChunkSize);
        uint64_t remaining = size;
        while (remaining > 0) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
            if (!gz_read_exact(gz.get(), archive, buf.data(), n)) {
                format_error(archive, "truncated tar entry " + name);
            }
            out.write(buf.data(), static_cast<std::streamsize>(n));
            remaining -= n;
        }
        out.close();
        if (out.fail()) {
            throw UpdateError(UpdateErrorKind::ArchiveFormatError,
                              "failed writing " + dest.string());
        }

        guard.release();
        return ExtractedBinary{dest, size};
    }

    not_found(archive, expected_name);
}

// ════════════════════════════════════════════════════════════════
// ZipExtractor
// ════════════════════════════════════════════════════════════════

ExtractedBinary ZipExtractor::extract_binary(const StagedArchive& archive,
                                             const std::string& expected_name,
                                             const fs::path& dest) const {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        format_error(archive, "archive_read_new failed");
    }
    archive_read_support_format_zip(reader.get());

    if (archive_read_open_filename(reader.get(), archive.path.string().c_str(), kChunkSize) != ARCHIVE_OK) {
        format_error(archive, archive_message(reader.get()));
    }

    struct archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        if (archive_entry_filetype(entry) != AE_IFREG || base_name(name) != expected_name) {
            if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
                format_error(archive, archive_message(reader.get()));
            }
            continue;
        }
        if (archive_entry_is_encrypted(entry)) {
            format_error(archive, name + " is encrypted");
        }

        OutputGuard guard(dest);
        std::ofstream out = open_output(dest);

        uint64_t written = 0;
        const void* buf = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        for (;;) {
            r = archive_read_data_block(reader.get(), &buf, &size, &offset);
            if (r == ARCHIVE_EOF) break;
            // ARCHIVE_WARN covers a CRC-32 mismatch on the final block
            if (r != ARCHIVE_OK) {
                format_error(archive, name + ": " + archive_message(reader.get()));
            }
            out.write(static_cast<const char*>(buf), static_cast<std::streamsize>(size));
            written += size;
        }

        out.close();
        if (out.fail()) {
            throw UpdateError(UpdateErrorKind::ArchiveFormatError, "failed writing " + dest.string());
        }

        guard.release();
        return ExtractedBinary{dest, written};
    }

    if (r != ARCHIVE_EOF) {
        format_error(archive, archive_message(reader.get()));
    }
    not_found(archive, expected_name);
}

// ════════════════════════════════════════════════════════════════
// RawExtractor
// ════════════════════════════════════════════════════════════════

ExtractedBinary RawExtractor::extract_binary(const StagedArchive& archive,
                                             const std::string& /*expected_name*/,
                                             const fs::path& dest) const {
    std::error_code ec;
    fs::copy_file(archive.path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(dest, ec);
        format_error(archive, "cannot stage " + archive.path.string());
    }

    auto size = fs::file_size(dest, ec);
    if (ec || size == 0) {
        fs::remove(dest, ec);
        format_error(archive, "downloaded binary is empty");
    }
    if (!looks_executable(dest)) {
        fs::remove(dest, ec);
        format_error(archive, "not an executable (no ELF, Mach-O, PE or #! header)");
    }
    return ExtractedBinary{dest, size};
}
