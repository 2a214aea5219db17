#ifdef _WIN32

#include "frogworks_tray/platform/windows_tray.h"
#include <iostream>

// Undefine Windows macros that conflict with our enums
#ifdef ERROR
#undef ERROR
#endif

#define DEBUG_LOG_TRAY(tray, msg) \
    if ((tray)->is_debug()) { \
        std::cout << "DEBUG: [Windows Tray] " << msg << std::endl; \
    }

// NOTIFYICON_VERSION_4 messages (defined in shellapi.h, but define if missing)
#ifndef NIN_SELECT
#define NIN_SELECT (WM_USER + 0)
#endif
#ifndef NIN_KEYSELECT
#define NIN_KEYSELECT (WM_USER + 1)
#endif
#ifndef NIN_BALLOONUSERCLICK
#define NIN_BALLOONUSERCLICK (WM_USER + 5)
#endif

namespace frogworks_tray {

namespace {
    const wchar_t* WINDOW_CLASS = L"FrogworksTrayClass";

    std::wstring utf8_to_wstring(const std::string& str) {
        if (str.empty()) return std::wstring();
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, nullptr, 0);
        std::wstring result(size_needed, 0);
        MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &result[0], size_needed);
        // Remove null terminator
        if (!result.empty() && result.back() == L'\0') {
            result.pop_back();
        }
        return result;
    }
}

WindowsTray::WindowsTray()
    : log_level_("info")
    , hwnd_(nullptr)
    , hinst_(GetModuleHandle(nullptr))
    , hmenu_(nullptr)
    , notification_icon_(nullptr)
    , owner_thread_(0)
    , should_exit_(false)
{
    ZeroMemory(&nid_, sizeof(nid_));
}

WindowsTray::~WindowsTray() {
    remove_tray_icon();
    if (hmenu_) {
        DestroyMenu(hmenu_);
    }
    if (hwnd_) {
        DestroyWindow(hwnd_);
    }
}

bool WindowsTray::initialize(const std::string& app_name, const std::string& icon_path) {
    app_name_ = app_name;
    icon_path_ = icon_path;
    tooltip_ = app_name;
    owner_thread_ = GetCurrentThreadId();

    DEBUG_LOG_TRAY(this, "Registering window class...");
    if (!register_window_class()) {
        std::cerr << "Failed to register window class" << std::endl;
        return false;
    }

    DEBUG_LOG_TRAY(this, "Creating hidden window...");
    if (!create_window()) {
        std::cerr << "Failed to create window" << std::endl;
        return false;
    }

    DEBUG_LOG_TRAY(this, "Adding tray icon...");
    if (!add_tray_icon()) {
        std::cerr << "Failed to add tray icon" << std::endl;
        return false;
    }

    if (ready_callback_) {
        ready_callback_();
    }

    return true;
}

bool WindowsTray::register_window_class() {
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = window_proc_static;
    wc.hInstance = hinst_;
    wc.lpszClassName = WINDOW_CLASS;
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);
    wc.hbrBackground = (HBRUSH)(COLOR_WINDOW + 1);

    if (!RegisterClassExW(&wc)) {
        DWORD error = GetLastError();
        if (error != ERROR_CLASS_ALREADY_EXISTS) {
            std::cerr << "RegisterClassExW failed with error: " << error << std::endl;
            return false;
        }
    }

    return true;
}

bool WindowsTray::create_window() {
    std::wstring title = utf8_to_wstring(app_name_);
    hwnd_ = CreateWindowExW(
        0,
        WINDOW_CLASS,
        title.c_str(),
        WS_OVERLAPPEDWINDOW,
        CW_USEDEFAULT, CW_USEDEFAULT,
        CW_USEDEFAULT, CW_USEDEFAULT,
        nullptr,
        nullptr,
        hinst_,
        this  // Picked up in WM_CREATE
    );

    if (!hwnd_) {
        std::cerr << "CreateWindowExW failed with error: " << GetLastError() << std::endl;
        return false;
    }

    SetWindowLongPtrW(hwnd_, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(this));
    return true;
}

bool WindowsTray::add_tray_icon() {
    nid_.cbSize = sizeof(NOTIFYICONDATAW);
    nid_.hWnd = hwnd_;
    nid_.uID = 1;
    nid_.uFlags = NIF_ICON | NIF_MESSAGE | NIF_TIP;
    nid_.uCallbackMessage = WM_TRAYICON;

    if (!icon_path_.empty()) {
        nid_.hIcon = (HICON)LoadImageA(
            nullptr,
            icon_path_.c_str(),
            IMAGE_ICON,
            0, 0,
            LR_LOADFROMFILE | LR_DEFAULTSIZE | LR_SHARED
        );
        if (!nid_.hIcon) {
            std::cerr << "Failed to load icon from: " << icon_path_ << std::endl;
        }
    }
    if (!nid_.hIcon) {
        nid_.hIcon = LoadIcon(nullptr, IDI_APPLICATION);
    }
    notification_icon_ = nid_.hIcon;

    std::wstring tooltip_wide = utf8_to_wstring(tooltip_);
    wcsncpy_s(nid_.szTip, tooltip_wide.c_str(), _TRUNCATE);

    if (!Shell_NotifyIconW(NIM_ADD, &nid_)) {
        std::cerr << "Shell_NotifyIconW failed" << std::endl;
        return false;
    }

    nid_.uVersion = NOTIFYICON_VERSION_4;
    Shell_NotifyIconW(NIM_SETVERSION, &nid_);

    return true;
}

void WindowsTray::remove_tray_icon() {
    if (hwnd_) {
        Shell_NotifyIconW(NIM_DELETE, &nid_);
    }
}

void WindowsTray::run() {
    MSG msg;
    while (!should_exit_ && GetMessageW(&msg, nullptr, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    // The window belongs to this thread, so it is torn down here
    remove_tray_icon();
    if (hmenu_) {
        DestroyMenu(hmenu_);
        hmenu_ = nullptr;
    }
    if (hwnd_) {
        HWND hwnd = hwnd_;
        hwnd_ = nullptr;
        DestroyWindow(hwnd);
    }
    DEBUG_LOG_TRAY(this, "Message loop exited");
}

void WindowsTray::stop() {
    should_exit_ = true;
    if (owner_thread_ != 0) {
        PostThreadMessageW(owner_thread_, WM_QUIT, 0, 0);
    }
}

void WindowsTray::set_menu(const Menu& menu) {
    DEBUG_LOG_TRAY(this, "set_menu() called with " << menu.items.size() << " items");
    std::lock_guard<std::mutex> lock(menu_mutex_);
    current_menu_ = menu;

    if (hmenu_) {
        DestroyMenu(hmenu_);
        hmenu_ = nullptr;
    }
    hmenu_ = create_popup_menu(current_menu_);
}

HMENU WindowsTray::create_popup_menu(const Menu& menu) {
    HMENU hmenu = CreatePopupMenu();
    menu_callbacks_.clear();
    int next_id = MENU_ID_START;

    for (const auto& item : menu.items) {
        if (item.is_separator) {
            AppendMenuW(hmenu, MF_SEPARATOR, 0, nullptr);
            continue;
        }

        int menu_id = next_id++;
        std::wstring text_wide = utf8_to_wstring(item.text);
        UINT flags = MF_STRING;
        if (!item.enabled) flags |= MF_GRAYED;
        AppendMenuW(hmenu, flags, menu_id, text_wide.c_str());

        if (item.callback) {
            menu_callbacks_[menu_id] = item.callback;
        }
    }

    return hmenu;
}

bool WindowsTray::activate(const std::string& text) {
    MenuCallback callback;
    {
        std::lock_guard<std::mutex> lock(menu_mutex_);
        for (const auto& item : current_menu_.items) {
            if (!item.is_separator && item.enabled && item.text == text && item.callback) {
                callback = item.callback;
                break;
            }
        }
    }

    if (!callback) {
        return false;
    }
    callback();
    return true;
}

void WindowsTray::show_context_menu() {
    if (!hmenu_) {
        DEBUG_LOG_TRAY(this, "No menu to show");
        return;
    }

    POINT cursor_pos;
    GetCursorPos(&cursor_pos);

    // Required for the menu to close when focus moves away
    SetForegroundWindow(hwnd_);

    BOOL result = TrackPopupMenu(
        hmenu_,
        TPM_RIGHTBUTTON | TPM_BOTTOMALIGN | TPM_RIGHTALIGN,
        cursor_pos.x,
        cursor_pos.y,
        0,
        hwnd_,
        nullptr
    );
    if (!result) {
        DEBUG_LOG_TRAY(this, "TrackPopupMenu failed with error: " << GetLastError());
    }

    PostMessageW(hwnd_, WM_NULL, 0, 0);
}

void WindowsTray::show_notification(
    const std::string& title,
    const std::string& message,
    NotificationType type)
{
    nid_.uFlags = NIF_INFO;

    std::wstring title_wide = utf8_to_wstring(title);
    std::wstring message_wide = utf8_to_wstring(message);
    wcsncpy_s(nid_.szInfoTitle, title_wide.c_str(), _TRUNCATE);
    wcsncpy_s(nid_.szInfo, message_wide.c_str(), _TRUNCATE);

    switch (type) {
        case NotificationType::WARNING:
            nid_.dwInfoFlags = NIIF_WARNING;
            break;
        case NotificationType::ERROR:
            nid_.dwInfoFlags = NIIF_ERROR;
            break;
        default:
            nid_.dwInfoFlags = NIIF_USER | NIIF_LARGE_ICON;
            nid_.hBalloonIcon = notification_icon_;
            break;
    }

    Shell_NotifyIconW(NIM_MODIFY, &nid_);

    nid_.uFlags = NIF_ICON | NIF_MESSAGE | NIF_TIP;
}

void WindowsTray::set_tooltip(const std::string& tooltip) {
    tooltip_ = tooltip;
    std::wstring tooltip_wide = utf8_to_wstring(tooltip);
    wcsncpy_s(nid_.szTip, tooltip_wide.c_str(), _TRUNCATE);
    Shell_NotifyIconW(NIM_MODIFY, &nid_);
}

void WindowsTray::set_log_level(const std::string& log_level) {
    log_level_ = log_level;
}

void WindowsTray::set_ready_callback(std::function<void()> callback) {
    ready_callback_ = callback;
}

LRESULT CALLBACK WindowsTray::window_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) {
    WindowsTray* tray = nullptr;

    if (msg == WM_CREATE) {
        CREATESTRUCT* cs = reinterpret_cast<CREATESTRUCT*>(lparam);
        tray = reinterpret_cast<WindowsTray*>(cs->lpCreateParams);
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(tray));
    } else {
        tray = reinterpret_cast<WindowsTray*>(GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    }

    if (tray) {
        return tray->window_proc(hwnd, msg, wparam, lparam);
    }

    return DefWindowProcW(hwnd, msg, wparam, lparam);
}

LRESULT WindowsTray::window_proc(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) {
    switch (msg) {
        case WM_TRAYICON:
            on_tray_icon(lparam);
            return 0;

        case WM_COMMAND:
            on_command(wparam);
            return 0;

        case WM_DESTROY:
            // Ends run() when the window goes away under us
            should_exit_ = true;
            PostQuitMessage(0);
            return 0;

        default:
            return DefWindowProcW(hwnd, msg, wparam, lparam);
    }
}

void WindowsTray::on_tray_icon(LPARAM lparam) {
    // With NOTIFYICON_VERSION_4 the event is in LOWORD(lParam)
    UINT msg = LOWORD(lparam);

    switch (msg) {
        case WM_LBUTTONUP:
        case WM_RBUTTONUP:
        case NIN_KEYSELECT:
        case NIN_BALLOONUSERCLICK:
            DEBUG_LOG_TRAY(this, "Tray icon event " << msg << ", showing menu");
            show_context_menu();
            break;

        default:
            break;
    }
}

void WindowsTray::on_command(WPARAM wparam) {
    int menu_id = LOWORD(wparam);

    MenuCallback callback;
    {
        std::lock_guard<std::mutex> lock(menu_mutex_);
        auto it = menu_callbacks_.find(menu_id);
        if (it != menu_callbacks_.end()) {
            callback = it->second;
        }
    }

    // Outside the lock: Quit stops the tray from inside its own loop
    if (callback) {
        callback();
    }
}

} // namespace frogworks_tray

#endif // _WIN32
