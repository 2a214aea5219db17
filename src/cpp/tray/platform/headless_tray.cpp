#include "frogworks_tray/platform/headless_tray.h"
#include <iostream>

namespace frogworks_tray {

#define DEBUG_LOG(tray, msg) \
    if ((tray)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Tray] " << msg << std::endl; \
    }

HeadlessTray::HeadlessTray()
    : log_level_("info")
    , running_(false)
    , should_exit_(false)
{
}

HeadlessTray::~HeadlessTray() {
    stop();
}

bool HeadlessTray::initialize(const std::string& app_name, const std::string& icon_path) {
    app_name_ = app_name;
    icon_path_ = icon_path;

    std::cout << "[Tray] " << app_name << " is running in the background" << std::endl;
    DEBUG_LOG(this, "Icon path: " << (icon_path.empty() ? "<default>" : icon_path));

    if (ready_callback_) {
        ready_callback_();
    }

    return true;
}

void HeadlessTray::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    running_ = true;
    DEBUG_LOG(this, "Event loop started");
    cv_.wait(lock, [this]() { return should_exit_; });
    running_ = false;
    DEBUG_LOG(this, "Event loop exited");
}

void HeadlessTray::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_exit_ = true;
    }
    cv_.notify_all();
}

void HeadlessTray::set_menu(const Menu& menu) {
    std::lock_guard<std::mutex> lock(mutex_);
    menu_ = menu;
    DEBUG_LOG(this, "Menu set with " << menu.items.size() << " items");
}

bool HeadlessTray::activate(const std::string& text) {
    MenuCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : menu_.items) {
            if (!item.is_separator && item.enabled && item.text == text && item.callback) {
                callback = item.callback;
                break;
            }
        }
    }

    if (!callback) {
        return false;
    }

    DEBUG_LOG(this, "Menu item activated: " << text);
    // Run outside the lock: a callback may stop the tray or replace the menu
    callback();
    return true;
}

void HeadlessTray::show_notification(
    const std::string& title,
    const std::string& message,
    NotificationType type)
{
    const char* prefix = "";
    switch (type) {
        case NotificationType::WARNING: prefix = "WARNING: "; break;
        case NotificationType::ERROR: prefix = "ERROR: "; break;
        default: break;
    }
    std::cout << "[Tray] " << prefix << title << " - " << message << std::endl;
}

void HeadlessTray::set_tooltip(const std::string& tooltip) {
    std::lock_guard<std::mutex> lock(mutex_);
    tooltip_ = tooltip;
}

void HeadlessTray::set_ready_callback(std::function<void()> callback) {
    ready_callback_ = callback;
}

void HeadlessTray::set_log_level(const std::string& log_level) {
    log_level_ = log_level;
}

bool HeadlessTray::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::vector<std::string> HeadlessTray::menu_labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> labels;
    for (const auto& item : menu_.items) {
        labels.push_back(item.is_separator ? "-" : item.text);
    }
    return labels;
}

} // namespace frogworks_tray
