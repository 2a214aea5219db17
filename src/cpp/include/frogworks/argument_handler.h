#pragma once

#include <functional>
#include <string>
#include <vector>

#include "frogworks/cli_parser.h"

namespace frogworks {

// Something an invocation asked the daemon to open, e.g. game 42
struct OpenTarget {
    std::string type;
    std::string id;

    // "game:42". Throws InvalidArgumentsException.
    static OpenTarget parse(const std::string& spec);

    // "frogworks://game/42" (trailing slash tolerated). Throws InvalidArgumentsException.
    static OpenTarget from_uri(const std::string& uri);

    bool operator==(const OpenTarget& other) const {
        return type == other.type && id == other.id;
    }
};

// Interprets the argument list of an invocation that reached the primary
// instance, either relayed or the primary's own startup arguments.
class ArgumentHandler {
public:
    struct Actions {
        std::function<void(const OpenTarget&)> open;
        std::function<void()> ping;
        std::function<void()> quit;
    };

    ArgumentHandler(Actions actions, const std::string& log_level = "info");

    // Throws InvalidArgumentsException if the arguments do not parse
    void handle(const std::vector<std::string>& args) const;

private:
    Actions actions_;
    std::string log_level_;
};

} // namespace frogworks
