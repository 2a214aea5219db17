#include "frogworks/relay_client.h"
#include "frogworks/error_types.h"
#include "frogworks/message_codec.h"
#include "frogworks/utils/socket_utils.h"

#include <iostream>
#include <stdexcept>

#ifndef _WIN32
#include <cerrno>
#endif

namespace frogworks {

#define DEBUG_LOG(client, msg) \
    if ((client)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Relay Client] " << msg << std::endl; \
    }

using utils::SocketUtils;

RelayClient::RelayClient(const std::string& host, uint16_t port, int connect_timeout_ms,
                         const std::string& log_level)
    : host_(host), port_(port), connect_timeout_ms_(connect_timeout_ms), log_level_(log_level) {
}

void RelayClient::relay(const std::vector<std::string>& args) {
    send(Envelope::Args(args));
}

void RelayClient::send(const Envelope& envelope) {
    // Encode first so an oversized envelope never opens a connection
    std::string frame = MessageCodec::encode(envelope);
    std::string address = host_ + ":" + std::to_string(port_);

    SocketUtils::initialize();

    sockaddr_in addr{};
    try {
        addr = SocketUtils::make_ipv4_address(host_, port_);
    } catch (const std::invalid_argument& e) {
        throw RelayException(RelayError::UNREACHABLE, e.what());
    }

    SOCKET sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock == FROGWORKS_INVALID_SOCKET) {
        throw RelayException(RelayError::UNREACHABLE,
                             "could not create socket: " + SocketUtils::error_string(SocketUtils::last_error_code()));
    }

#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    // Non-blocking connect so a wedged primary cannot hang the invoking process
    SocketUtils::set_nonblocking(sock, true);
    DEBUG_LOG(this, "Connecting to " << address);

    int rc = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0) {
        int err = SocketUtils::last_error_code();
#ifdef _WIN32
        bool in_progress = (err == WSAEWOULDBLOCK);
#else
        bool in_progress = (err == EINPROGRESS);
#endif
        if (!in_progress) {
            SocketUtils::close_socket(sock);
            throw RelayException(RelayError::UNREACHABLE,
                                 "connect to " + address + " failed: " + SocketUtils::error_string(err));
        }

        int ready = SocketUtils::wait_writable(sock, connect_timeout_ms_);
        if (ready == 0) {
            SocketUtils::close_socket(sock);
            throw RelayException(RelayError::UNREACHABLE,
                                 "connect to " + address + " timed out after " +
                                 std::to_string(connect_timeout_ms_) + " ms");
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &len);
        if (ready < 0 || so_error != 0) {
            SocketUtils::close_socket(sock);
            throw RelayException(RelayError::UNREACHABLE,
                                 "connect to " + address + " failed: " +
                                 SocketUtils::error_string(so_error != 0 ? so_error : SocketUtils::last_error_code()));
        }
    }

    SocketUtils::set_nonblocking(sock, false);
    DEBUG_LOG(this, "Connected, sending " << frame.size() << " byte frame");

    if (!SocketUtils::send_all(sock, frame.data(), frame.size())) {
        int err = SocketUtils::last_error_code();
        SocketUtils::close_socket(sock);
        throw RelayException(RelayError::TRANSPORT_FAILURE,
                             "write to " + address + " failed: " + SocketUtils::error_string(err));
    }

    // Half-close so the server sees EOF right after the frame
#ifdef _WIN32
    shutdown(sock, SD_SEND);
#else
    shutdown(sock, SHUT_WR);
#endif
    SocketUtils::close_socket(sock);

    DEBUG_LOG(this, "Relayed '" << envelope.tag << "' envelope to " << address);
}

} // namespace frogworks
