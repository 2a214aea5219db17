#pragma once

#include <memory>
#include <string>

#include "frogworks/utils/platform_constants.h"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace frogworks {

// Process-wide exclusivity token arbitrated by the OS.
// POSIX: flock() on <directory>/frogworks_<name>.lock
// Windows: named mutex Global\Frogworks<name>Mutex
// The OS drops the lock when the process exits by any path.
class InstanceLock {
public:
    // Returns the held lock, or nullptr if another process already holds it.
    // Throws InstanceLockException for any other failure.
    static std::unique_ptr<InstanceLock> acquire(
        const std::string& name,
        const std::string& directory = PlatformConstants::INSTANCE_LOCK_DIR);

    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }
    bool is_held() const;

private:
#ifdef _WIN32
    InstanceLock(const std::string& name, const std::string& path, HANDLE mutex);
    HANDLE mutex_;
#else
    InstanceLock(const std::string& name, const std::string& path, int fd);
    int fd_;
#endif
    std::string name_;
    std::string path_;
};

} // namespace frogworks
