#pragma once

#include "frogworks/message.h"
#include "frogworks/utils/platform_constants.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace frogworks {

// Wire format: [4-byte big-endian body length][JSON body]
// Body: {"kind": "<tag>", "payload": <value>}
class MessageCodec {
public:
    // Encode an envelope as one complete frame (header + body)
    static std::string encode(const Envelope& envelope);

    // Decode one complete frame. Throws DecodeException.
    static Envelope decode(const std::string& frame);

    // Decode a frame body (no length prefix). Throws DecodeException.
    static Envelope decode_body(const std::string& body);

    // Parse and validate a 4-byte length prefix. Throws DecodeException.
    static uint32_t read_length(const char* header, size_t max_frame_size = PlatformConstants::MAX_FRAME_SIZE);

    static void write_length(uint32_t length, char* header);
};

// Accumulates bytes from a stream and yields complete frame bodies.
// Bytes past the end of a frame are kept for the next call.
class FrameReader {
public:
    explicit FrameReader(size_t max_frame_size = PlatformConstants::MAX_FRAME_SIZE);

    void feed(const char* data, size_t size);

    // Returns the next complete body, or nullopt if more bytes are needed.
    // Throws DecodeException on a malformed length prefix.
    std::optional<std::string> next_frame();

    size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
    size_t max_frame_size_;
};

} // namespace frogworks
