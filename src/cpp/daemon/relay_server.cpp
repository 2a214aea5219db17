#include "frogworks/relay_server.h"
#include "frogworks/error_types.h"
#include "frogworks/message_codec.h"

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>

#ifndef _WIN32
#include <cerrno>
#include <unistd.h>
#endif

namespace frogworks {

#define DEBUG_LOG(server, msg) \
    if ((server)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Relay Server] " << msg << std::endl; \
    }

using utils::SocketUtils;

RelayServer::RelayServer(std::shared_ptr<MessageDispatcher> dispatcher,
                         const std::string& host,
                         uint16_t port,
                         int read_timeout_ms,
                         const std::string& log_level)
    : dispatcher_(std::move(dispatcher))
    , host_(host)
    , port_(port)
    , read_timeout_ms_(read_timeout_ms)
    , log_level_(log_level)
{
}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::bind() {
    std::string address = host_ + ":" + std::to_string(port_);

    SocketUtils::initialize();

    sockaddr_in addr{};
    try {
        addr = SocketUtils::make_ipv4_address(host_, port_);
    } catch (const std::invalid_argument& e) {
        throw BindException(address, e.what());
    }

    SOCKET sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock == FROGWORKS_INVALID_SOCKET) {
        throw BindException(address, "could not create socket: " +
                            SocketUtils::error_string(SocketUtils::last_error_code()));
    }

    int opt = 1;
#ifdef _WIN32
    // Never share the port with another listener
    setsockopt(sock, SOL_SOCKET, SO_EXCLUSIVEADDRUSE, reinterpret_cast<const char*>(&opt), sizeof(opt));
#else
    // Allows a quick restart over TIME_WAIT; a live listener still blocks bind()
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#endif

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = SocketUtils::last_error_code();
        SocketUtils::close_socket(sock);
        throw BindException(address, SocketUtils::error_string(err));
    }

    if (listen(sock, PlatformConstants::RELAY_BACKLOG) != 0) {
        int err = SocketUtils::last_error_code();
        SocketUtils::close_socket(sock);
        throw BindException(address, "listen failed: " + SocketUtils::error_string(err));
    }

    listen_socket_ = sock;
    bound_port_ = SocketUtils::local_port(sock);
    stopping_ = false;

    std::cout << "[Relay Server] Listening on " << host_ << ":" << bound_port_ << std::endl;
}

void RelayServer::set_failure_callback(std::function<void(const std::string&)> callback) {
    failure_callback_ = std::move(callback);
}

void RelayServer::start() {
    if (listen_socket_ == FROGWORKS_INVALID_SOCKET) {
        bind();
    }
    running_ = true;
    accept_thread_ = std::thread([this]() { serve(); });
}

void RelayServer::serve() {
    if (listen_socket_ == FROGWORKS_INVALID_SOCKET) {
        throw FrogworksException("Relay server must be bound before serving");
    }

    running_ = true;
    DEBUG_LOG(this, "Accept loop started");

    while (!stopping_) {
        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        SOCKET client = accept(listen_socket_, reinterpret_cast<sockaddr*>(&peer), &peer_len);

        if (client == FROGWORKS_INVALID_SOCKET) {
            if (stopping_) {
                break;
            }

            int err = SocketUtils::last_error_code();
#ifdef _WIN32
            bool listener_invalid = (err == WSAENOTSOCK || err == WSAEINVAL || err == WSAEINTR);
#else
            if (err == EINTR || err == ECONNABORTED) {
                continue;
            }
            bool listener_invalid = (err == EBADF || err == EINVAL || err == ENOTSOCK);
#endif
            if (listener_invalid) {
                std::string reason = "listener is no longer valid (" + SocketUtils::error_string(err) + ")";
                std::cerr << "[Relay Server] " << reason << ", leaving accept loop" << std::endl;
                running_ = false;
                if (failure_callback_) {
                    failure_callback_(reason);
                }
                break;
            }

            // Transient (e.g. out of descriptors): log, back off briefly and keep serving
            std::cerr << "[Relay Server] accept failed: " << SocketUtils::error_string(err) << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        if (stopping_) {
            SocketUtils::close_socket(client);
            break;
        }

        DEBUG_LOG(this, "Accepted connection from port " << ntohs(peer.sin_port));

        reap_finished_connections(false);

        auto conn = std::make_unique<Connection>();
        conn->sock = client;
        Connection* raw = conn.get();

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(std::move(conn));
        raw->thread = std::thread(&RelayServer::handle_connection, this, raw);
    }

    running_ = false;
    DEBUG_LOG(this, "Accept loop exited");
}

void RelayServer::handle_connection(Connection* conn) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(read_timeout_ms_);

    try {
        FrameReader reader;
        char buffer[PlatformConstants::RELAY_READ_BUFFER_SIZE];
        std::optional<std::string> body;

        while (!(body = reader.next_frame())) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (remaining <= 0) {
                throw DecodeException("no complete frame within " + std::to_string(read_timeout_ms_) +
                                      " ms (" + std::to_string(reader.buffered()) + " bytes received)");
            }

            int ready = SocketUtils::wait_readable(conn->sock, static_cast<int>(remaining));
            if (ready == 0) {
                continue;  // Deadline check above reports the timeout
            }
            if (ready < 0) {
                throw DecodeException("connection error: " +
                                      SocketUtils::error_string(SocketUtils::last_error_code()));
            }

            auto n = recv(conn->sock, buffer, static_cast<int>(sizeof(buffer)), 0);
            if (n < 0) {
                int err = SocketUtils::last_error_code();
#ifndef _WIN32
                if (err == EINTR) continue;
#endif
                throw DecodeException("read failed: " + SocketUtils::error_string(err));
            }
            if (n == 0) {
                if (reader.buffered() == 0) {
                    throw DecodeException("connection closed before any frame was sent");
                }
                throw DecodeException("truncated frame: connection closed after " +
                                      std::to_string(reader.buffered()) + " bytes");
            }

            reader.feed(buffer, static_cast<size_t>(n));
        }

        Envelope envelope = MessageCodec::decode_body(*body);
        DEBUG_LOG(this, "Decoded '" << envelope.tag << "' message (" << body->size() << " bytes)");
        dispatcher_->dispatch(envelope);

    } catch (const DecodeException& e) {
        if (!stopping_) {
            std::cerr << "[Relay Server] Dropping connection: " << e.what() << std::endl;
        }
    } catch (const FrogworksException& e) {
        std::cerr << "[Relay Server] Handler rejected relayed message: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Relay Server] Unexpected error while handling connection: " << e.what() << std::endl;
    }

    // Peer sees EOF now; the descriptor itself is closed when reaped
    SocketUtils::shutdown_socket(conn->sock);
    conn->done = true;
}

void RelayServer::reap_finished_connections(bool join_all) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        Connection* conn = it->get();
        if (join_all || conn->done) {
            if (conn->thread.joinable()) {
                conn->thread.join();
            }
            // Closed only after the handler is gone so the descriptor cannot be reused under it
            SocketUtils::close_socket(conn->sock);
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void RelayServer::stop() {
    stopping_ = true;

    if (listen_socket_ != FROGWORKS_INVALID_SOCKET) {
#ifdef _WIN32
        // closesocket is what unblocks accept() on Windows
        SocketUtils::close_socket(listen_socket_);
        listen_socket_ = FROGWORKS_INVALID_SOCKET;
#else
        SocketUtils::shutdown_socket(listen_socket_);
#endif
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& conn : connections_) {
            if (!conn->done) {
                SocketUtils::shutdown_socket(conn->sock);
            }
        }
    }
    reap_finished_connections(true);

    if (listen_socket_ != FROGWORKS_INVALID_SOCKET) {
        SocketUtils::close_socket(listen_socket_);
        listen_socket_ = FROGWORKS_INVALID_SOCKET;
    }

    running_ = false;
}

} // namespace frogworks
