#include "frogworks/utils/socket_utils.h"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>

#ifdef _WIN32
    #pragma comment(lib, "ws2_32.lib")
    #define poll WSAPoll
#else
    #include <arpa/inet.h>
    #include <fcntl.h>
    #include <poll.h>
    #include <unistd.h>

    #define closesocket close
#endif

namespace frogworks {
namespace utils {

void SocketUtils::initialize() {
#ifdef _WIN32
    static std::once_flag once;
    std::call_once(once, []() {
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    });
#endif
}

void SocketUtils::close_socket(SOCKET sock) {
    if (sock != FROGWORKS_INVALID_SOCKET) {
        closesocket(sock);
    }
}

void SocketUtils::shutdown_socket(SOCKET sock) {
    if (sock == FROGWORKS_INVALID_SOCKET) {
        return;
    }
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

int SocketUtils::last_error_code() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string SocketUtils::error_string(int code) {
#ifdef _WIN32
    return "WSA error " + std::to_string(code);
#else
    return std::strerror(code);
#endif
}

bool SocketUtils::set_nonblocking(SOCKET sock, bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    return ioctlsocket(sock, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(sock, F_SETFL, flags) == 0;
#endif
}

bool SocketUtils::send_all(SOCKET sock, const char* data, size_t size) {
#if defined(MSG_NOSIGNAL)
    const int flags = MSG_NOSIGNAL;  // Peer hang-up must not raise SIGPIPE
#else
    const int flags = 0;
#endif
    size_t sent = 0;
    while (sent < size) {
        auto n = send(sock, data + sent, static_cast<int>(size - sent), flags);
        if (n < 0) {
#ifndef _WIN32
            if (errno == EINTR) continue;
#endif
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

static int wait_for_events(SOCKET sock, short events, int timeout_ms) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = events;
    while (true) {
        int rc = poll(&pfd, 1, timeout_ms);
#ifndef _WIN32
        if (rc < 0 && errno == EINTR) continue;
#endif
        if (rc <= 0) return rc;
        if (pfd.revents & (events | POLLHUP | POLLERR)) return rc;
        return -1;
    }
}

int SocketUtils::wait_readable(SOCKET sock, int timeout_ms) {
    return wait_for_events(sock, POLLIN, timeout_ms);
}

int SocketUtils::wait_writable(SOCKET sock, int timeout_ms) {
    return wait_for_events(sock, POLLOUT, timeout_ms);
}

sockaddr_in SocketUtils::make_ipv4_address(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("Not a valid IPv4 address: " + host);
    }
    return addr;
}

uint16_t SocketUtils::local_port(SOCKET sock) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace utils
} // namespace frogworks
