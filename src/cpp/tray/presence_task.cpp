#include "frogworks_tray/presence_task.h"
#include <frogworks/error_types.h>

#include <iostream>
#include <thread>

namespace frogworks_tray {

#define DEBUG_LOG(task, msg) \
    if ((task)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Presence] " << msg << std::endl; \
    }

PresenceTask::PresenceTask(std::unique_ptr<TrayInterface> tray, const std::string& log_level)
    : tray_(std::move(tray))
    , log_level_(log_level)
{
}

PresenceTask::~PresenceTask() = default;

void PresenceTask::set_ping_callback(std::function<std::string()> callback) {
    ping_callback_ = std::move(callback);
}

Menu PresenceTask::create_menu(frogworks::ShutdownSignal& shutdown) {
    Menu menu;
    menu.add_item(MenuItem::Label(MenuText::TITLE));

    if (ping_callback_) {
        menu.add_item(MenuItem::Action(MenuText::PING, [this]() { on_ping(); }));
    }

    menu.add_separator();
    menu.add_item(MenuItem::Action(MenuText::QUIT, [&shutdown]() {
        std::cout << "[Presence] Quit selected from tray" << std::endl;
        shutdown.signal();
    }));

    return menu;
}

void PresenceTask::on_ping() {
    std::string status = ping_callback_();
    tray_->show_notification("Frogworks", status);
}

void PresenceTask::run(frogworks::ShutdownSignal& shutdown) {
    if (!tray_) {
        throw frogworks::FrogworksException("No tray available for this platform",
                                            frogworks::ErrorType::TRAY_ERROR);
    }

    tray_->set_log_level(log_level_);
    tray_->set_ready_callback([this]() {
        DEBUG_LOG(this, "Tray ready");
    });

    DEBUG_LOG(this, "Initializing tray...");
    if (!tray_->initialize("Frogworks", "")) {
        throw frogworks::FrogworksException("Failed to initialize tray",
                                            frogworks::ErrorType::TRAY_ERROR);
    }

    tray_->set_tooltip("Frogworks");
    tray_->set_menu(create_menu(shutdown));
    DEBUG_LOG(this, "Menu built, entering event loop...");

    // The loop runs on the thread that created the tray: native trays only
    // receive their window messages there.
    std::thread watcher([this, &shutdown]() {
        shutdown.wait();
        DEBUG_LOG(this, "Shutdown observed, stopping tray");
        tray_->stop();
    });

    tray_->run();

    // A loop that ended on its own (tray window destroyed) also ends the daemon
    if (shutdown.signal()) {
        std::cout << "[Presence] Tray closed, shutting down" << std::endl;
    }
    watcher.join();
}

} // namespace frogworks_tray
