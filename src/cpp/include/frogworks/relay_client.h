#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "frogworks/message.h"
#include "frogworks/utils/platform_constants.h"

namespace frogworks {

// Sends one framed envelope to the primary instance and disconnects.
// Fire-and-forget: a completed write is the only confirmation.
class RelayClient {
public:
    RelayClient(const std::string& host = PlatformConstants::RELAY_HOST,
                uint16_t port = PlatformConstants::RELAY_PORT,
                int connect_timeout_ms = PlatformConstants::RELAY_CONNECT_TIMEOUT_MS,
                const std::string& log_level = "info");

    // Relay an invocation's arguments (program name excluded).
    // Throws RelayException (UNREACHABLE or TRANSPORT_FAILURE).
    void relay(const std::vector<std::string>& args);

    // Send an arbitrary envelope
    void send(const Envelope& envelope);

private:
    std::string host_;
    uint16_t port_;
    int connect_timeout_ms_;
    std::string log_level_;
};

} // namespace frogworks
