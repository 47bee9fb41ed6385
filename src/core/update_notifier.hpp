#pragma once

#include "core/updater.hpp"

#include <ostream>
#include <string>
#include <thread>

/// Background "new version available" check.
///
/// start() fetches the latest tag on a worker thread; finish() joins it and
/// prints a banner when the tag differs from the running version. Every
/// failure (network, parse, timeout) is dropped: the notifier never throws,
/// never writes files and never changes the host command's exit status.
class UpdateNotifier {
public:
    explicit UpdateNotifier(UpdateOptions options);
    ~UpdateNotifier();

    UpdateNotifier(const UpdateNotifier&) = delete;
    UpdateNotifier& operator=(const UpdateNotifier&) = delete;

    void start();

    /// Wait for the check; prints the banner to `out` and returns true if a
    /// different release is available
    bool finish(std::ostream& out);

    static std::string banner(const std::string& binary,
                              const std::string& current_version,
                              const std::string& latest_version);

private:
    void run() noexcept;

    UpdateOptions options_;
    std::thread worker_;
    bool started_ = false;

    // Written by the worker, read only after join()
    bool available_ = false;
    std::string latest_version_;
};
