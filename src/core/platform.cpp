#include "core/platform.hpp"
#include "core/update_error.hpp"

#ifndef _WIN32
#include <sys/utsname.h>
#endif

ArchKind Platform::arch_from_machine(const std::string& machine) {
    if (machine == "x86_64" || machine == "amd64" || machine == "AMD64") {
        return ArchKind::Amd64;
    }
    if (machine == "aarch64" || machine == "arm64" || machine == "ARM64") {
        return ArchKind::Arm64;
    }
    throw UpdateError(UpdateErrorKind::UnsupportedPlatform,
                      "unsupported CPU architecture '" + machine + "'");
}

PlatformInfo Platform::detect() {
    PlatformInfo info;

#if defined(__linux__)
    info.os = OsKind::Linux;
#elif defined(__APPLE__)
    info.os = OsKind::Darwin;
#elif defined(_WIN32)
    info.os = OsKind::Windows;
#else
    throw UpdateError(UpdateErrorKind::UnsupportedPlatform, "unsupported operating system");
#endif

#if defined(_WIN32)
#if defined(_M_ARM64)
    info.arch = ArchKind::Arm64;
#else
    info.arch = ArchKind::Amd64;
#endif
#else
    struct utsname uts;
    if (uname(&uts) != 0) {
        throw UpdateError(UpdateErrorKind::UnsupportedPlatform, "uname() failed");
    }
    info.arch = arch_from_machine(uts.machine);
#endif

    return info;
}

std::string Platform::os_name(OsKind os) {
    switch (os) {
        case OsKind::Linux:   return "linux";
        case OsKind::Darwin:  return "darwin";
        case OsKind::Windows: return "windows";
    }
    return "unknown";
}

std::string Platform::arch_name(ArchKind arch) {
    switch (arch) {
        case ArchKind::Amd64: return "amd64";
        case ArchKind::Arm64: return "arm64";
    }
    return "unknown";
}

std::vector<std::string> Platform::os_tokens(OsKind os) {
    // Releases of the tool have published macOS builds as "macOS"
    if (os == OsKind::Darwin) {
        return {"darwin", "macOS"};
    }
    return {os_name(os)};
}

std::vector<std::string> Platform::legacy_arch_tokens(ArchKind arch) {
    switch (arch) {
        case ArchKind::Amd64: return {"x86_64"};
        case ArchKind::Arm64: return {"arm64", "aarch64"};
    }
    return {};
}

std::string Platform::executable_name(const std::string& binary, const PlatformInfo& platform) {
    if (platform.os == OsKind::Windows) {
        return binary + ".exe";
    }
    return binary;
}

std::string Platform::describe(const PlatformInfo& platform) {
    return os_name(platform.os) + "/" + arch_name(platform.arch);
}
