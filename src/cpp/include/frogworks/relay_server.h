#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "frogworks/message_dispatcher.h"
#include "frogworks/utils/platform_constants.h"
#include "frogworks/utils/socket_utils.h"

namespace frogworks {

// Loopback listener run by the primary instance. Every accepted connection
// is read, decoded and dispatched on its own thread.
class RelayServer {
public:
    RelayServer(std::shared_ptr<MessageDispatcher> dispatcher,
                const std::string& host = PlatformConstants::RELAY_HOST,
                uint16_t port = PlatformConstants::RELAY_PORT,
                int read_timeout_ms = PlatformConstants::RELAY_READ_TIMEOUT_MS,
                const std::string& log_level = "info");
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Bind and listen. Throws BindException. Port 0 picks an ephemeral port.
    void bind();

    // Accept loop. Returns only after stop() or if the listener becomes invalid.
    void serve();

    // bind() if needed, then serve() on a background thread
    void start();

    // Close the listener, wake in-flight connections and join all threads
    void stop();

    // Called from the accept thread when the listener fails outside of stop()
    void set_failure_callback(std::function<void(const std::string&)> callback);

    bool is_running() const { return running_; }
    uint16_t port() const { return bound_port_; }

private:
    struct Connection {
        SOCKET sock = FROGWORKS_INVALID_SOCKET;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void handle_connection(Connection* conn);
    void reap_finished_connections(bool join_all);

    std::shared_ptr<MessageDispatcher> dispatcher_;
    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    int read_timeout_ms_;
    std::string log_level_;

    SOCKET listen_socket_ = FROGWORKS_INVALID_SOCKET;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;
    std::function<void(const std::string&)> failure_callback_;

    std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

} // namespace frogworks
