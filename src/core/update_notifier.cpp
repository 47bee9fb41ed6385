#include "core/update_notifier.hpp"
#include "core/version.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

UpdateNotifier::UpdateNotifier(UpdateOptions options) : options_(std::move(options)) {}

UpdateNotifier::~UpdateNotifier() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void UpdateNotifier::start() {
    if (started_) return;
    started_ = true;

    // Development builds never nag
    if (Version::is_development_build(options_.current_version)) {
        return;
    }

    try {
        worker_ = std::thread(&UpdateNotifier::run, this);
    } catch (const std::system_error&) {
        // No thread, no banner
    }
}

void UpdateNotifier::run() noexcept {
    try {
        Updater updater(options_);
        UpdateInfo info = updater.check_for_update();
        if (info.available && !info.latest_version.empty()) {
            latest_version_ = info.latest_version;
            available_ = true;
        }
    } catch (const std::exception&) {
        // No banner
    }
}

bool UpdateNotifier::finish(std::ostream& out) {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!available_) {
        return false;
    }

    out << banner(options_.binary_name,
                  Version::strip_prefix(options_.current_version),
                  latest_version_);
    out.flush();
    return true;
}

std::string UpdateNotifier::banner(const std::string& binary,
                                   const std::string& current_version,
                                   const std::string& latest_version) {
    std::ostringstream line1, line2, line3;
    line1 << "A new version of " << binary << " is available!";
    line2 << "Current: v" << current_version << "  Latest: v" << latest_version;
    line3 << "Run: " << binary << " update";

    size_t width = std::max({line1.str().size(), line2.str().size(), line3.str().size()}) + 4;

    auto row = [&](const std::string& text) {
        return "| " + text + std::string(width - 1 - text.size(), ' ') + "|\n";
    };
    const std::string rule = "+" + std::string(width, '-') + "+\n";

    std::string out = "\n" + rule;
    out += row(line1.str());
    out += row(line2.str());
    out += row("");
    out += row(line3.str());
    out += rule + "\n";
    return out;
}
