#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace frogworks {

using json = nlohmann::json;

// Message variants carried on the relay channel. New kinds are added here;
// peers that do not know a kind decode it as UNKNOWN and drop it.
enum class MessageKind {
    ARGS,
    UNKNOWN
};

namespace MessageTag {
    constexpr const char* ARGS = "args";
}

MessageKind kind_from_tag(const std::string& tag);
const char* tag_for_kind(MessageKind kind);

struct Envelope {
    MessageKind kind = MessageKind::UNKNOWN;
    std::string tag;        // Raw kind string as it appeared on the wire
    json payload;

    static Envelope Args(const std::vector<std::string>& args) {
        Envelope env;
        env.kind = MessageKind::ARGS;
        env.tag = MessageTag::ARGS;
        env.payload = args;
        return env;
    }

    // Only valid for ARGS envelopes (the codec has already validated the shape)
    std::vector<std::string> args() const {
        return payload.get<std::vector<std::string>>();
    }
};

} // namespace frogworks
