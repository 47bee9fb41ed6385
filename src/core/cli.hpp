#pragma once

#include <string>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version(const Config& config);
    static int cmd_update(int argc, char* argv[], const Config& config);
    static int cmd_config(int argc, char* argv[], const Config& config);

    static int update_self(const Config& config);
    static int update_check(const Config& config);
};
