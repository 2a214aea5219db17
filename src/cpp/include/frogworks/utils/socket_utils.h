#pragma once

#include <cstdint>
#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #define FROGWORKS_INVALID_SOCKET INVALID_SOCKET
#else
    #include <netinet/in.h>
    #include <sys/socket.h>
    typedef int SOCKET;
    #define FROGWORKS_INVALID_SOCKET (-1)
#endif

namespace frogworks {
namespace utils {

class SocketUtils {
public:
    // WSAStartup on Windows (once per process), no-op elsewhere
    static void initialize();

    static void close_socket(SOCKET sock);

    // Disable further sends and receives; wakes threads blocked on the socket
    static void shutdown_socket(SOCKET sock);

    static int last_error_code();
    static std::string error_string(int code);

    static bool set_nonblocking(SOCKET sock, bool enabled);

    // Write the whole buffer. Returns false on the first failed send.
    static bool send_all(SOCKET sock, const char* data, size_t size);

    // >0 readable, 0 timed out, <0 error
    static int wait_readable(SOCKET sock, int timeout_ms);

    // >0 writable, 0 timed out, <0 error
    static int wait_writable(SOCKET sock, int timeout_ms);

    // Fill an IPv4 address. Throws std::invalid_argument for a bad host.
    static sockaddr_in make_ipv4_address(const std::string& host, uint16_t port);

    // Port a bound socket is listening on
    static uint16_t local_port(SOCKET sock);
};

} // namespace utils
} // namespace frogworks
