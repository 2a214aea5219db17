#include "frogworks_tray/daemon_app.h"
#include <frogworks/cli_parser.h>
#include <frogworks/daemon_config.h>
#include <frogworks/version.h>
#include <iostream>
#include <exception>

// Entry point for the daemon. Also the target of frogworks:// links, which
// start a second process that relays its arguments to the running one.
int main(int argc, char* argv[]) {
    try {
        // Validate locally so usage errors show up in the invoking terminal
        frogworks::CLIParser parser;
        parser.parse(argc, argv);

        // Check if we should continue (false for --help or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        if (parser.should_show_version()) {
            std::cout << "frogworks-daemon version " << FROGWORKS_VERSION << std::endl;
            return 0;
        }

        frogworks::DaemonConfig config;
        config.load_env_defaults();
        config.apply(parser.get_invocation());

        std::vector<std::string> args(argv + 1, argv + argc);

        frogworks_tray::DaemonApp app(config, args);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return frogworks_tray::ExitCode::FATAL;
    }
}
