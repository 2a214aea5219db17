#include "frogworks/message_dispatcher.h"

#include <iostream>

namespace frogworks {

#define DEBUG_LOG(dispatcher, msg) \
    if ((dispatcher)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Dispatcher] " << msg << std::endl; \
    }

MessageDispatcher::MessageDispatcher(const std::string& log_level)
    : log_level_(log_level) {
}

void MessageDispatcher::register_handler(MessageKind kind, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[kind] = std::move(handler);
}

void MessageDispatcher::on_args(std::function<void(const std::vector<std::string>&)> handler) {
    register_handler(MessageKind::ARGS, [handler](const Envelope& env) {
        handler(env.args());
    });
}

bool MessageDispatcher::dispatch(const Envelope& envelope) const {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        if (envelope.kind != MessageKind::UNKNOWN) {
            auto it = handlers_.find(envelope.kind);
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }
    }

    if (!handler) {
        DEBUG_LOG(this, "Ignoring message with unhandled kind '" << envelope.tag << "'");
        return false;
    }

    DEBUG_LOG(this, "Dispatching '" << envelope.tag << "' message");
    handler(envelope);
    return true;
}

} // namespace frogworks
