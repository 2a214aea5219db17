#pragma once

#include "platform/tray_interface.h"
#include "presence_task.h"
#include <frogworks/argument_handler.h>
#include <frogworks/daemon_config.h>
#include <frogworks/message_dispatcher.h>
#include <frogworks/relay_server.h>
#include <frogworks/shutdown_signal.h>
#include <frogworks/single_instance.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace frogworks_tray {

namespace ExitCode {
    constexpr int OK = 0;
    constexpr int FATAL = 1;          // Lock, bind, listener, tray or command line failure
    constexpr int RELAY_FAILED = 2;   // Secondary invocation could not reach the primary
}

enum class DaemonState {
    STARTING,
    RELAYING,
    PRIMARY,
    SHUTTING_DOWN,
    TERMINATED
};

using TrayFactory = std::function<std::unique_ptr<TrayInterface>()>;

// Process entry: becomes the primary instance (relay server + tray) or relays
// this invocation's arguments to the primary and exits.
class DaemonApp {
public:
    DaemonApp(const frogworks::DaemonConfig& config, std::vector<std::string> args);
    ~DaemonApp();

    DaemonApp(const DaemonApp&) = delete;
    DaemonApp& operator=(const DaemonApp&) = delete;

    int run();
    void shutdown();  // Public method for signal handlers

    // Called with every resolved open request on the primary
    void set_open_callback(std::function<void(const frogworks::OpenTarget&)> callback);

    // Called once the primary is serving relays
    void set_ready_callback(std::function<void()> callback);

    void set_tray_factory(TrayFactory factory);

    DaemonState state() const { return state_; }

    // Port the primary's relay server is bound to (0 before it is)
    uint16_t relay_port() const { return bound_port_; }

private:
    int run_relay();
    int run_primary();

    void handle_invocation(const std::vector<std::string>& args, const char* source);
    std::string ping_backend();

    void install_signal_handlers();
    void remove_signal_handlers();

    frogworks::DaemonConfig config_;
    std::vector<std::string> args_;
    std::atomic<DaemonState> state_{DaemonState::STARTING};
    std::atomic<uint16_t> bound_port_{0};

    frogworks::ShutdownSignal shutdown_;
    std::unique_ptr<frogworks::InstanceLock> lock_;
    std::shared_ptr<frogworks::MessageDispatcher> dispatcher_;
    std::unique_ptr<frogworks::ArgumentHandler> argument_handler_;
    std::unique_ptr<frogworks::RelayServer> server_;
    std::unique_ptr<PresenceTask> presence_;

    std::function<void(const frogworks::OpenTarget&)> open_callback_;
    std::function<void()> ready_callback_;
    TrayFactory tray_factory_;

    std::thread presence_thread_;
    std::atomic<bool> presence_failed_{false};
    std::atomic<bool> relay_failed_{false};

    bool signal_handlers_installed_ = false;
#ifndef _WIN32
    std::thread signal_monitor_thread_;
#endif
};

} // namespace frogworks_tray
