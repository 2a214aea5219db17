#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace frogworks {

// Thin client for the Frogworks backend. Only the health ping lives here;
// the rest of the REST API belongs to the CLI.
class BackendClient {
public:
    explicit BackendClient(const std::string& base_url, const std::string& log_level = "info");

    // GET /ping. Returns the parsed body, throws BackendException.
    nlohmann::json ping();

    const std::string& base_url() const { return base_url_; }

private:
    std::string make_http_request(const std::string& endpoint, const std::string& method = "GET",
                                  const std::string& body = "");

    std::string base_url_;
    std::string log_level_;
};

} // namespace frogworks
