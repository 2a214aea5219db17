#pragma once

#include "platform/tray_interface.h"
#include <frogworks/shutdown_signal.h>

#include <functional>
#include <memory>
#include <string>

namespace frogworks_tray {

// Menu entries owned by the presence task
namespace MenuText {
    constexpr const char* TITLE = "Frogworks";
    constexpr const char* PING = "Ping Frogworks Server";
    constexpr const char* QUIT = "Quit Frogworks";
}

// Keeps the primary instance visible in the tray until shutdown is signaled.
class PresenceTask {
public:
    PresenceTask(std::unique_ptr<TrayInterface> tray, const std::string& log_level = "info");
    ~PresenceTask();

    // Returns a short status line shown as a notification
    void set_ping_callback(std::function<std::string()> callback);

    // Registers the tray and menu once, then runs the tray loop on the calling
    // thread until shutdown fires. Throws FrogworksException if the tray
    // cannot be initialized.
    void run(frogworks::ShutdownSignal& shutdown);

    TrayInterface* tray() const { return tray_.get(); }

private:
    Menu create_menu(frogworks::ShutdownSignal& shutdown);
    void on_ping();

    std::unique_ptr<TrayInterface> tray_;
    std::function<std::string()> ping_callback_;
    std::string log_level_;
};

} // namespace frogworks_tray
