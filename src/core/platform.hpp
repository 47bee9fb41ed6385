#pragma once

#include <string>
#include <vector>

enum class OsKind { Linux, Darwin, Windows };
enum class ArchKind { Amd64, Arm64 };

struct PlatformInfo {
    OsKind os = OsKind::Linux;
    ArchKind arch = ArchKind::Amd64;
};

class Platform {
public:
    /// Detect the OS and CPU of the running process.
    /// Throws UpdateError{UnsupportedPlatform} outside linux/darwin/windows x amd64/arm64.
    static PlatformInfo detect();

    /// Map a uname machine string ("x86_64", "aarch64", ...) to an ArchKind.
    /// Throws UpdateError{UnsupportedPlatform} for anything else.
    static ArchKind arch_from_machine(const std::string& machine);

    /// "linux", "darwin", "windows"
    static std::string os_name(OsKind os);

    /// "amd64", "arm64"
    static std::string arch_name(ArchKind arch);

    /// OS tokens used in asset names, canonical first ("darwin", "macOS")
    static std::vector<std::string> os_tokens(OsKind os);

    /// Architecture tokens used by older release tooling ("x86_64", "aarch64")
    static std::vector<std::string> legacy_arch_tokens(ArchKind arch);

    /// File name of the executable inside a release archive ("fifi" / "fifi.exe")
    static std::string executable_name(const std::string& binary, const PlatformInfo& platform);

    /// "linux/amd64"
    static std::string describe(const PlatformInfo& platform);
};
