#pragma once

#include <frogworks/message_dispatcher.h>
#include <frogworks/relay_server.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace frogworks_test {

// Lock names are per process and per test so parallel ctest runs never collide
inline std::string unique_lock_name(const std::string& prefix) {
    static std::atomic<int> counter{0};
    return "test_" + prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++);
}

// A loopback port with nothing listening on it
inline uint16_t closed_port() {
    frogworks::RelayServer scratch(std::make_shared<frogworks::MessageDispatcher>(), "127.0.0.1", 0);
    scratch.bind();
    uint16_t port = scratch.port();
    scratch.stop();
    return port;
}

// Shut down the listening socket bound to this port, as a failing network stack
// would. The descriptor stays open so nothing else can reuse it.
inline bool shutdown_listener(uint16_t port) {
    for (int fd = 0; fd < 1024; ++fd) {
        int listening = 0;
        socklen_t len = sizeof(listening);
        if (getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &listening, &len) != 0 || !listening) {
            continue;
        }
        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0 ||
            addr.sin_family != AF_INET || ntohs(addr.sin_port) != port) {
            continue;
        }
        return ::shutdown(fd, SHUT_RDWR) == 0;
    }
    return false;
}

template <typename T>
class Collector {
public:
    void add(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(value);
        }
        cv_.notify_all();
    }

    bool wait_for_count(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return items_.size() >= count; });
    }

    std::vector<T> items() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<T> items_;
};

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace frogworks_test
