#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>

namespace frogworks_tray {

// Notification types
enum class NotificationType {
    INFO,
    WARNING,
    ERROR,
    SUCCESS
};

// Menu callback signature
using MenuCallback = std::function<void()>;

// Menu item structure
struct MenuItem {
    std::string text;
    MenuCallback callback;
    bool enabled = true;
    bool is_separator = false;

    // Factory methods
    static MenuItem Separator() {
        MenuItem item;
        item.is_separator = true;
        return item;
    }

    static MenuItem Action(const std::string& text, MenuCallback callback, bool enabled = true) {
        MenuItem item;
        item.text = text;
        item.callback = callback;
        item.enabled = enabled;
        return item;
    }

    // Non-clickable title row
    static MenuItem Label(const std::string& text) {
        return Action(text, nullptr, false);
    }
};

// Menu structure
struct Menu {
    std::vector<MenuItem> items;

    void add_item(const MenuItem& item) {
        items.push_back(item);
    }

    void add_separator() {
        items.push_back(MenuItem::Separator());
    }
};

// Abstract tray interface
class TrayInterface {
public:
    virtual ~TrayInterface() = default;

    // Lifecycle
    virtual bool initialize(const std::string& app_name, const std::string& icon_path) = 0;
    virtual void run() = 0;   // Blocks until stop()
    virtual void stop() = 0;

    // Menu management
    virtual void set_menu(const Menu& menu) = 0;

    // Invoke the enabled menu item with this text, as a click would.
    // Returns false if there is no such item.
    virtual bool activate(const std::string& text) = 0;

    // Notifications
    virtual void show_notification(
        const std::string& title,
        const std::string& message,
        NotificationType type = NotificationType::INFO
    ) = 0;

    virtual void set_tooltip(const std::string& tooltip) = 0;

    // Set callback for when ready
    virtual void set_ready_callback(std::function<void()> callback) = 0;

    // Set log level for debug logging
    virtual void set_log_level(const std::string& log_level) = 0;
};

// Factory function to create the tray for this platform
std::unique_ptr<TrayInterface> create_tray();

} // namespace frogworks_tray
