#pragma once

#include <cstdint>
#include <cstddef>

namespace PlatformConstants {
    // Instance identity. Fixed at build time, never read from config.
    inline constexpr char INSTANCE_LOCK_NAME[] = "frogworks_daemon";
#ifdef _WIN32
    inline constexpr char INSTANCE_LOCK_DIR[] = "";  // Named mutex, no directory
#else
    inline constexpr char INSTANCE_LOCK_DIR[] = "/tmp";
#endif

    // Loopback relay channel shared by the relay client and server
    inline constexpr char RELAY_HOST[] = "127.0.0.1";
    inline constexpr uint16_t RELAY_PORT = 47831;
    inline constexpr int RELAY_BACKLOG = 16;

    // Relay timing
    inline constexpr int RELAY_CONNECT_TIMEOUT_MS = 2000;
    inline constexpr int RELAY_READ_TIMEOUT_MS = 5000;

    // Framing: 4-byte big-endian length prefix, body capped at 1 MiB
    inline constexpr size_t FRAME_HEADER_SIZE = 4;
    inline constexpr size_t MAX_FRAME_SIZE = 1024 * 1024;
    inline constexpr size_t RELAY_READ_BUFFER_SIZE = 4096;

    // Frogworks backend
    inline constexpr char DEFAULT_API_URL[] = "http://localhost:8000";
    inline constexpr int API_CONNECT_TIMEOUT_SEC = 10;
    inline constexpr int API_READ_TIMEOUT_SEC = 30;

    // URI scheme registered by the installer
    inline constexpr char URI_SCHEME[] = "frogworks";
}
