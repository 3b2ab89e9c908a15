#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate {

using json = nlohmann::json;

/// Well-known loopback port of the daemon control channel
constexpr unsigned short kDaemonPort = 8686;

namespace request_type {
constexpr const char* kStdio = "stdio";
constexpr const char* kStatus = "status";
constexpr const char* kStop = "stop";
}

/**
 * @brief Control request, one JSON document per connection
 */
struct DaemonRequest {
    std::string type;
    std::string command;
    std::vector<std::string> args;
    std::string id;
    std::map<std::string, std::string> metadata;   // "config": path to a config file
};

/**
 * @brief Control response, one JSON document per connection
 */
struct DaemonResponse {
    bool success = false;
    std::string server_id;
    int port = 0;
    std::string error;
    json data;                 // null when absent

    static DaemonResponse failure(std::string message) {
        DaemonResponse response;
        response.error = std::move(message);
        return response;
    }
};

void to_json(json& j, const DaemonRequest& request);
void from_json(const json& j, DaemonRequest& request);

void to_json(json& j, const DaemonResponse& response);
void from_json(const json& j, DaemonResponse& response);

/**
 * @brief Decode one request line
 * @throws std::invalid_argument if the text is not a request object
 */
DaemonRequest parse_request(const std::string& text);

/**
 * @brief Decode one response line
 * @throws std::invalid_argument if the text is not a response object
 */
DaemonResponse parse_response(const std::string& text);

} // namespace mcpgate
