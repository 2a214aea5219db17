#include "frogworks/message_codec.h"
#include "frogworks/error_types.h"

#include <utility>

namespace frogworks {

MessageKind kind_from_tag(const std::string& tag) {
    if (tag == MessageTag::ARGS) {
        return MessageKind::ARGS;
    }
    return MessageKind::UNKNOWN;
}

const char* tag_for_kind(MessageKind kind) {
    switch (kind) {
        case MessageKind::ARGS: return MessageTag::ARGS;
        case MessageKind::UNKNOWN: break;
    }
    return "unknown";
}

void MessageCodec::write_length(uint32_t length, char* header) {
    header[0] = static_cast<char>((length >> 24) & 0xFF);
    header[1] = static_cast<char>((length >> 16) & 0xFF);
    header[2] = static_cast<char>((length >> 8) & 0xFF);
    header[3] = static_cast<char>(length & 0xFF);
}

uint32_t MessageCodec::read_length(const char* header, size_t max_frame_size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(header);
    uint32_t length = (static_cast<uint32_t>(bytes[0]) << 24) |
                      (static_cast<uint32_t>(bytes[1]) << 16) |
                      (static_cast<uint32_t>(bytes[2]) << 8) |
                      static_cast<uint32_t>(bytes[3]);

    if (length == 0) {
        throw DecodeException("frame length is zero");
    }
    if (length > max_frame_size) {
        throw DecodeException("frame length " + std::to_string(length) +
                              " exceeds limit of " + std::to_string(max_frame_size) + " bytes");
    }
    return length;
}

// Arguments are OS byte strings; JSON strings must be UTF-8
static bool is_utf8(const std::string& value) {
    try {
        json(value).dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

// Non-UTF-8 arguments travel as {"bytes": [..]} and are restored on decode
static json args_to_wire(const json& payload) {
    json wire = json::array();
    for (const auto& item : payload) {
        if (item.is_string() && !is_utf8(item.get_ref<const std::string&>())) {
            const auto& raw = item.get_ref<const std::string&>();
            json bytes = json::array();
            for (unsigned char c : raw) {
                bytes.push_back(static_cast<int>(c));
            }
            json entry = json::object();
            entry["bytes"] = std::move(bytes);
            wire.push_back(std::move(entry));
        } else {
            wire.push_back(item);
        }
    }
    return wire;
}

static std::string arg_from_wire(const json& item) {
    if (item.is_string()) {
        return item.get<std::string>();
    }
    if (!item.is_object() || !item.contains("bytes") || !item["bytes"].is_array()) {
        throw DecodeException("'args' payload contains a non-string element");
    }

    std::string raw;
    for (const auto& byte : item["bytes"]) {
        if (!byte.is_number_unsigned() || byte.get<uint64_t>() > 255) {
            throw DecodeException("'args' byte element is out of range");
        }
        raw.push_back(static_cast<char>(byte.get<uint64_t>()));
    }
    return raw;
}

std::string MessageCodec::encode(const Envelope& envelope) {
    json payload = envelope.payload;
    if (envelope.kind == MessageKind::ARGS && payload.is_array()) {
        payload = args_to_wire(payload);
    }

    json body_json = {
        {"kind", envelope.tag.empty() ? tag_for_kind(envelope.kind) : envelope.tag},
        {"payload", payload}
    };

    std::string body;
    try {
        body = body_json.dump();
    } catch (const json::exception& e) {
        throw InvalidArgumentsException(std::string("envelope cannot be encoded: ") + e.what());
    }

    if (body.size() > PlatformConstants::MAX_FRAME_SIZE) {
        throw InvalidArgumentsException("encoded envelope of " + std::to_string(body.size()) +
                                        " bytes exceeds frame limit");
    }

    std::string frame(PlatformConstants::FRAME_HEADER_SIZE, '\0');
    write_length(static_cast<uint32_t>(body.size()), &frame[0]);
    frame += body;
    return frame;
}

Envelope MessageCodec::decode(const std::string& frame) {
    if (frame.size() < PlatformConstants::FRAME_HEADER_SIZE) {
        throw DecodeException("truncated length prefix (" + std::to_string(frame.size()) + " bytes)");
    }

    uint32_t length = read_length(frame.data());
    size_t available = frame.size() - PlatformConstants::FRAME_HEADER_SIZE;
    if (available < length) {
        throw DecodeException("truncated frame: expected " + std::to_string(length) +
                              " bytes, got " + std::to_string(available));
    }
    if (available > length) {
        throw DecodeException("trailing bytes after frame body");
    }

    return decode_body(frame.substr(PlatformConstants::FRAME_HEADER_SIZE));
}

Envelope MessageCodec::decode_body(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::exception& e) {
        throw DecodeException(std::string("invalid JSON body: ") + e.what());
    }

    if (!parsed.is_object()) {
        throw DecodeException("envelope is not a JSON object");
    }
    if (!parsed.contains("kind") || !parsed["kind"].is_string()) {
        throw DecodeException("envelope has no string 'kind'");
    }

    Envelope env;
    env.tag = parsed["kind"].get<std::string>();
    env.kind = kind_from_tag(env.tag);
    env.payload = parsed.contains("payload") ? parsed["payload"] : json();

    // Structural validation for the kinds we understand
    if (env.kind == MessageKind::ARGS) {
        if (!env.payload.is_array()) {
            throw DecodeException("'args' payload is not an array");
        }
        json args = json::array();
        for (const auto& item : env.payload) {
            args.push_back(arg_from_wire(item));
        }
        env.payload = std::move(args);
    }

    return env;
}

FrameReader::FrameReader(size_t max_frame_size)
    : max_frame_size_(max_frame_size) {
}

void FrameReader::feed(const char* data, size_t size) {
    buffer_.append(data, size);
}

std::optional<std::string> FrameReader::next_frame() {
    if (buffer_.size() < PlatformConstants::FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    uint32_t length = MessageCodec::read_length(buffer_.data(), max_frame_size_);
    size_t total = PlatformConstants::FRAME_HEADER_SIZE + length;
    if (buffer_.size() < total) {
        return std::nullopt;
    }

    std::string body = buffer_.substr(PlatformConstants::FRAME_HEADER_SIZE, length);
    buffer_.erase(0, total);
    return body;
}

} // namespace frogworks
