#include "frogworks/single_instance.h"
#include "frogworks/error_types.h"

#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <errno.h>
#endif

namespace frogworks {

#ifdef _WIN32

std::unique_ptr<InstanceLock> InstanceLock::acquire(const std::string& name, const std::string& /*directory*/) {
    // Use Global namespace for system-wide mutex
    std::string mutex_name = "Global\\Frogworks" + name + "Mutex";

    HANDLE mutex = CreateMutexA(NULL, TRUE, mutex_name.c_str());
    DWORD error = GetLastError();

    if (mutex == NULL) {
        throw InstanceLockException(name, "CreateMutex failed with error " + std::to_string(error));
    }

    if (error == ERROR_ALREADY_EXISTS) {
        // Another instance is running
        CloseHandle(mutex);
        return nullptr;
    }

    return std::unique_ptr<InstanceLock>(new InstanceLock(name, mutex_name, mutex));
}

InstanceLock::InstanceLock(const std::string& name, const std::string& path, HANDLE mutex)
    : mutex_(mutex), name_(name), path_(path) {
}

InstanceLock::~InstanceLock() {
    if (mutex_) {
        ReleaseMutex(mutex_);
        CloseHandle(mutex_);
        mutex_ = nullptr;
    }
}

bool InstanceLock::is_held() const {
    return mutex_ != nullptr;
}

#else

std::unique_ptr<InstanceLock> InstanceLock::acquire(const std::string& name, const std::string& directory) {
    std::string lock_file = directory + "/frogworks_" + name + ".lock";

    int fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666);
    if (fd == -1) {
        throw InstanceLockException(name, "cannot open " + lock_file + ": " + strerror(errno));
    }

    // Try to acquire exclusive lock (non-blocking)
    if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return nullptr;  // Another instance has the lock
        }
        throw InstanceLockException(name, "flock on " + lock_file + " failed: " + strerror(err));
    }

    return std::unique_ptr<InstanceLock>(new InstanceLock(name, lock_file, fd));
}

InstanceLock::InstanceLock(const std::string& name, const std::string& path, int fd)
    : fd_(fd), name_(name), path_(path) {
}

InstanceLock::~InstanceLock() {
    // Closing the descriptor drops the flock. The file itself stays so that a
    // racing process never locks an unlinked inode.
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
}

bool InstanceLock::is_held() const {
    return fd_ != -1;
}

#endif

} // namespace frogworks
