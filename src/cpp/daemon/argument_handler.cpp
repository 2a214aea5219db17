#include "frogworks/argument_handler.h"
#include "frogworks/error_types.h"
#include "frogworks/utils/platform_constants.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace frogworks {

#define DEBUG_LOG(handler, msg) \
    if ((handler)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Arguments] " << msg << std::endl; \
    }

static bool is_valid_type(const std::string& type) {
    if (type.empty()) return false;
    return std::all_of(type.begin(), type.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

static bool is_valid_id(const std::string& id) {
    if (id.empty()) return false;
    return std::none_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isspace(c) || c == '/';
    });
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

OpenTarget OpenTarget::parse(const std::string& spec) {
    auto colon = spec.find(':');
    if (colon == std::string::npos) {
        throw InvalidArgumentsException("open target '" + spec + "' must look like <type>:<id>");
    }

    OpenTarget target;
    target.type = to_lower(spec.substr(0, colon));
    target.id = spec.substr(colon + 1);

    if (!is_valid_type(target.type) || !is_valid_id(target.id)) {
        throw InvalidArgumentsException("open target '" + spec + "' must look like <type>:<id>");
    }
    return target;
}

OpenTarget OpenTarget::from_uri(const std::string& uri) {
    std::string prefix = std::string(PlatformConstants::URI_SCHEME) + ":";
    if (to_lower(uri.substr(0, prefix.size())) != prefix) {
        throw InvalidArgumentsException("'" + uri + "' is not a " + prefix + "// link");
    }

    std::string rest = uri.substr(prefix.size());
    while (!rest.empty() && rest.front() == '/') {
        rest.erase(0, 1);
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        throw InvalidArgumentsException("link '" + uri + "' must look like " + prefix + "//<type>/<id>");
    }

    OpenTarget target;
    target.type = to_lower(rest.substr(0, slash));
    target.id = rest.substr(slash + 1);

    if (!is_valid_type(target.type) || !is_valid_id(target.id)) {
        throw InvalidArgumentsException("link '" + uri + "' must look like " + prefix + "//<type>/<id>");
    }
    return target;
}

ArgumentHandler::ArgumentHandler(Actions actions, const std::string& log_level)
    : actions_(std::move(actions)), log_level_(log_level) {
}

void ArgumentHandler::handle(const std::vector<std::string>& args) const {
    if (args.empty()) {
        DEBUG_LOG(this, "Invocation carried no arguments");
        return;
    }

    Invocation inv = CLIParser::parse_relayed(args);

    if (!inv.log_level.empty() || inv.no_tray || !inv.api_url.empty()) {
        DEBUG_LOG(this, "Ignoring process-local settings in relayed invocation");
    }

    if (!inv.has_action()) {
        std::cout << "[Arguments] Invocation requested no action" << std::endl;
        return;
    }

    // Resolve every target before acting so a bad link does not half-apply
    std::vector<OpenTarget> targets;
    if (!inv.open_target.empty()) {
        targets.push_back(OpenTarget::parse(inv.open_target));
    }
    if (!inv.uri.empty()) {
        targets.push_back(OpenTarget::from_uri(inv.uri));
    }

    for (const auto& target : targets) {
        std::cout << "[Arguments] Open requested: " << target.type << " " << target.id << std::endl;
        if (actions_.open) actions_.open(target);
    }

    if (inv.ping) {
        DEBUG_LOG(this, "Ping requested");
        if (actions_.ping) actions_.ping();
    }

    // Last, so everything else in the same invocation still runs
    if (inv.quit) {
        std::cout << "[Arguments] Quit requested" << std::endl;
        if (actions_.quit) actions_.quit();
    }
}

} // namespace frogworks
