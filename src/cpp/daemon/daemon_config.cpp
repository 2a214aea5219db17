#include "frogworks/daemon_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace frogworks {

static std::string getenv_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

static bool is_truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void DaemonConfig::load_env_defaults() {
    std::string env_log_level = getenv_or_empty("FROGWORKS_LOG_LEVEL");
    if (!env_log_level.empty()) {
        if (env_log_level == "error" || env_log_level == "warning" ||
            env_log_level == "info" || env_log_level == "debug") {
            log_level = env_log_level;
        } else {
            std::cerr << "WARNING: Ignoring invalid FROGWORKS_LOG_LEVEL '" << env_log_level << "'" << std::endl;
        }
    }

    std::string env_no_tray = getenv_or_empty("FROGWORKS_NO_TRAY");
    if (!env_no_tray.empty()) {
        no_tray = is_truthy(env_no_tray);
    }

    std::string env_api_url = getenv_or_empty("FROGWORKS_API_URL");
    if (!env_api_url.empty()) {
        api_url = env_api_url;
    }

    std::string env_timeout = getenv_or_empty("FROGWORKS_RELAY_TIMEOUT_MS");
    if (!env_timeout.empty()) {
        try {
            int value = std::stoi(env_timeout);
            if (value > 0) {
                read_timeout_ms = value;
            } else {
                std::cerr << "WARNING: FROGWORKS_RELAY_TIMEOUT_MS must be positive, keeping "
                          << read_timeout_ms << std::endl;
            }
        } catch (const std::exception&) {
            std::cerr << "WARNING: Ignoring non-numeric FROGWORKS_RELAY_TIMEOUT_MS '" << env_timeout << "'" << std::endl;
        }
    }
}

void DaemonConfig::apply(const Invocation& invocation) {
    if (!invocation.log_level.empty()) {
        log_level = invocation.log_level;
    }
    if (invocation.no_tray) {
        no_tray = true;
    }
    if (!invocation.api_url.empty()) {
        api_url = invocation.api_url;
    }
}

} // namespace frogworks
