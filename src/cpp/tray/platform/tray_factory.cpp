#include "frogworks_tray/platform/tray_interface.h"

#ifdef _WIN32
#include "frogworks_tray/platform/windows_tray.h"
#else
#include "frogworks_tray/platform/headless_tray.h"
#endif

namespace frogworks_tray {

// TODO: add an AppIndicator-backed tray for Linux desktops once a GUI toolkit
// is added to the build; until then non-Windows platforms get the headless tray.
std::unique_ptr<TrayInterface> create_tray() {
#ifdef _WIN32
    return std::make_unique<WindowsTray>();
#else
    return std::make_unique<HeadlessTray>();
#endif
}

} // namespace frogworks_tray
