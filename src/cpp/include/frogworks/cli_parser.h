#pragma once

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace frogworks {

// One invocation of the daemon executable, either typed by the user or
// launched through a frogworks:// link
struct Invocation {
    // Actions
    std::string open_target;   // --open <type>:<id>
    std::string uri;           // frogworks://<type>/<id>
    bool ping = false;
    bool quit = false;

    // Settings that only apply to the process that parses them
    std::string log_level;     // Empty means "not given on the command line"
    bool no_tray = false;
    std::string api_url;

    bool has_action() const {
        return !open_target.empty() || !uri.empty() || ping || quit;
    }
};

class CLIParser {
public:
    CLIParser();

    // Parse the process's own command line. Prints help/errors via CLI11.
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    // Parse arguments without the program name. Same reporting as above.
    int parse(const std::vector<std::string>& args);

    Invocation get_invocation() const { return invocation_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

    bool should_show_version() const { return show_version_; }

    // Parse a relayed argument list without printing anything.
    // Throws InvalidArgumentsException for any parse error, including --help.
    static Invocation parse_relayed(const std::vector<std::string>& args);

private:
    CLI::App app_;
    Invocation invocation_;
    bool show_version_ = false;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace frogworks
