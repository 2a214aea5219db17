#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "frogworks/message.h"

namespace frogworks {

using MessageHandler = std::function<void(const Envelope&)>;

// Maps a message kind to the action that consumes it. Kinds without a
// handler (including UNKNOWN) are logged and dropped.
class MessageDispatcher {
public:
    explicit MessageDispatcher(const std::string& log_level = "info");

    void register_handler(MessageKind kind, MessageHandler handler);

    // Convenience for the only defined variant
    void on_args(std::function<void(const std::vector<std::string>&)> handler);

    // Returns true if a handler consumed the envelope
    bool dispatch(const Envelope& envelope) const;

private:
    std::map<MessageKind, MessageHandler> handlers_;
    mutable std::mutex handlers_mutex_;
    std::string log_level_;
};

} // namespace frogworks
