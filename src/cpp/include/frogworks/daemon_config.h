#pragma once

#include <cstdint>
#include <string>

#include "frogworks/cli_parser.h"
#include "frogworks/utils/platform_constants.h"

namespace frogworks {

struct DaemonConfig {
    // User-facing settings: constants < environment < command line
    std::string log_level = "info";
    bool no_tray = false;
    std::string api_url = PlatformConstants::DEFAULT_API_URL;
    int read_timeout_ms = PlatformConstants::RELAY_READ_TIMEOUT_MS;

    // Fixed identity of the instance. Not exposed to the environment or the
    // command line; only embedders (tests) set these.
    std::string lock_name = PlatformConstants::INSTANCE_LOCK_NAME;
    std::string lock_directory = PlatformConstants::INSTANCE_LOCK_DIR;
    std::string relay_host = PlatformConstants::RELAY_HOST;
    uint16_t relay_port = PlatformConstants::RELAY_PORT;
    int connect_timeout_ms = PlatformConstants::RELAY_CONNECT_TIMEOUT_MS;
    bool install_signal_handlers = true;

    // FROGWORKS_LOG_LEVEL, FROGWORKS_NO_TRAY, FROGWORKS_API_URL, FROGWORKS_RELAY_TIMEOUT_MS
    void load_env_defaults();

    // Settings given on the command line win over everything else
    void apply(const Invocation& invocation);
};

} // namespace frogworks
