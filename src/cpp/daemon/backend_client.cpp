#include "frogworks/backend_client.h"
#include "frogworks/error_types.h"
#include "frogworks/utils/platform_constants.h"

#include <iostream>

// Plain HTTP only; no OpenSSL support is compiled in
#include <httplib.h>

namespace frogworks {

#define DEBUG_LOG(client, msg) \
    if ((client)->log_level_ == "debug") { \
        std::cout << "DEBUG: [Backend] " << msg << std::endl; \
    }

static const char* USER_AGENT = "Frogworks Daemon";

BackendClient::BackendClient(const std::string& base_url, const std::string& log_level)
    : base_url_(base_url), log_level_(log_level) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

nlohmann::json BackendClient::ping() {
    std::string response = make_http_request("/ping");
    try {
        return nlohmann::json::parse(response);
    } catch (const nlohmann::json::exception& e) {
        throw BackendException(std::string("invalid JSON from /ping: ") + e.what());
    }
}

std::string BackendClient::make_http_request(const std::string& endpoint, const std::string& method,
                                             const std::string& body) {
    DEBUG_LOG(this, method << " " << base_url_ << endpoint);

    httplib::Client cli(base_url_);
    if (!cli.is_valid()) {
        throw BackendException("invalid backend URL '" + base_url_ + "'");
    }
    cli.set_connection_timeout(PlatformConstants::API_CONNECT_TIMEOUT_SEC, 0);
    cli.set_read_timeout(PlatformConstants::API_READ_TIMEOUT_SEC, 0);

    httplib::Headers headers = {{"User-Agent", USER_AGENT}};
    httplib::Result res;

    if (method == "GET") {
        res = cli.Get(endpoint, headers);
    } else if (method == "POST") {
        res = cli.Post(endpoint, headers, body, "application/x-www-form-urlencoded");
    } else {
        throw BackendException("unsupported HTTP method: " + method);
    }

    if (!res) {
        throw BackendException("request to " + base_url_ + endpoint + " failed: " +
                               httplib::to_string(res.error()));
    }

    DEBUG_LOG(this, "Status " << res->status);

    if (res->status < 200 || res->status >= 300) {
        throw BackendException(endpoint + " returned HTTP " + std::to_string(res->status), res->status);
    }

    return res->body;
}

} // namespace frogworks
