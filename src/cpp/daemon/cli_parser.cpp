#include <frogworks/cli_parser.h>
#include <frogworks/error_types.h>
#include <frogworks/utils/platform_constants.h>

namespace frogworks {

CLIParser::CLIParser()
    : app_("frogworks-daemon - Frogworks background agent") {

    // Add version flag (help is automatically added by CLI11)
    app_.add_flag("-v,--version", show_version_, "Show version number");

    // Actions, forwarded to the running instance when there is one
    app_.add_option("--open", invocation_.open_target, "Open a Frogworks item, e.g. game:42");

    app_.add_option("uri", invocation_.uri, "frogworks:// link to open")
        ->check([](const std::string& val) -> std::string {
            std::string prefix = std::string(PlatformConstants::URI_SCHEME) + ":";
            if (val.compare(0, prefix.size(), prefix) != 0) {
                return "Expected a " + prefix + "// link (got '" + val + "')";
            }
            return "";  // Valid
        });

    app_.add_flag("--ping", invocation_.ping, "Ping the Frogworks backend");

    app_.add_flag("--quit", invocation_.quit, "Ask the running instance to exit");

    // Local settings
    app_.add_option("--log-level", invocation_.log_level, "Log level for the daemon")
        ->check(CLI::IsMember({"error", "warning", "info", "debug"}));

    app_.add_flag("--no-tray", invocation_.no_tray, "Run without a tray icon");

    app_.add_option("--api-url", invocation_.api_url, "Base URL of the Frogworks backend");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;  // Don't continue, just exit
        return exit_code_;
    }
}

int CLIParser::parse(const std::vector<std::string>& args) {
    // CLI11 consumes the vector from the back
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app_.parse(reversed);
        should_continue_ = true;
        exit_code_ = 0;
        return 0;
    } catch (const CLI::ParseError& e) {
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

Invocation CLIParser::parse_relayed(const std::vector<std::string>& args) {
    CLIParser parser;
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        parser.app_.parse(reversed);
    } catch (const CLI::CallForHelp&) {
        throw InvalidArgumentsException("--help cannot be relayed");
    } catch (const CLI::ParseError& e) {
        throw InvalidArgumentsException(e.what());
    }
    return parser.invocation_;
}

} // namespace frogworks
