#pragma once

#include "tray_interface.h"

#include <condition_variable>
#include <mutex>

namespace frogworks_tray {

// Tray without GUI dependencies: keeps the menu in memory and reports to the
// console. Menu actions are reachable through activate().
class HeadlessTray : public TrayInterface {
public:
    HeadlessTray();
    ~HeadlessTray() override;

    // TrayInterface implementation
    bool initialize(const std::string& app_name, const std::string& icon_path) override;
    void run() override;
    void stop() override;
    void set_menu(const Menu& menu) override;
    bool activate(const std::string& text) override;
    void show_notification(
        const std::string& title,
        const std::string& message,
        NotificationType type = NotificationType::INFO
    ) override;
    void set_tooltip(const std::string& tooltip) override;
    void set_ready_callback(std::function<void()> callback) override;
    void set_log_level(const std::string& log_level) override;

    bool is_running() const;
    std::vector<std::string> menu_labels() const;

private:
    std::string app_name_;
    std::string icon_path_;
    std::string tooltip_;
    std::string log_level_;
    std::function<void()> ready_callback_;

    Menu menu_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_;
    bool should_exit_;
};

} // namespace frogworks_tray
