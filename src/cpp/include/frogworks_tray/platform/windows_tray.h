#pragma once

#ifdef _WIN32

#include "tray_interface.h"
#include <windows.h>
#include <shellapi.h>

// Undefine Windows macros that conflict with our code
#ifdef ERROR
#undef ERROR
#endif

#include <atomic>
#include <map>
#include <mutex>

namespace frogworks_tray {

// Notification-area icon with a popup menu. All window calls must come from
// the thread that called initialize(); run() pumps that thread's messages.
class WindowsTray : public TrayInterface {
public:
    WindowsTray();
    ~WindowsTray() override;

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

    bool is_debug() const { return log_level_ == "debug"; }

private:
    bool register_window_class();
    bool create_window();
    bool add_tray_icon();
    void remove_tray_icon();
    HMENU create_popup_menu(const Menu& menu);
    void show_context_menu();

    static LRESULT CALLBACK window_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam);
    LRESULT window_proc(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam);

    void on_tray_icon(LPARAM lparam);
    void on_command(WPARAM wparam);

    std::string app_name_;
    std::string icon_path_;
    std::string tooltip_;
    std::string log_level_;
    HWND hwnd_;
    HINSTANCE hinst_;
    NOTIFYICONDATAW nid_;
    HMENU hmenu_;
    HICON notification_icon_;
    DWORD owner_thread_;
    std::atomic<bool> should_exit_;
    std::function<void()> ready_callback_;

    // Guards the menu and its callbacks; activate() may come from any thread
    std::mutex menu_mutex_;
    Menu current_menu_;
    std::map<int, MenuCallback> menu_callbacks_;

    static constexpr UINT WM_TRAYICON = WM_USER + 1;
    static constexpr int MENU_ID_START = 1000;
};

} // namespace frogworks_tray

#endif // _WIN32
