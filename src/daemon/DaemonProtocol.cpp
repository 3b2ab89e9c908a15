#include "DaemonProtocol.hpp"
#include <stdexcept>

namespace mcpgate {

void to_json(json& j, const DaemonRequest& request) {
    j = {
        {"type", request.type},
        {"command", request.command},
        {"args", request.args},
        {"id", request.id},
        {"metadata", request.metadata}
    };
}

void from_json(const json& j, DaemonRequest& request) {
    request.type = j.value("type", "");
    request.command = j.value("command", "");
    request.id = j.value("id", "");

    request.args.clear();
    if (j.contains("args") && !j["args"].is_null()) {
        request.args = j["args"].get<std::vector<std::string>>();
    }

    request.metadata.clear();
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        request.metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }
}

void to_json(json& j, const DaemonResponse& response) {
    j = {{"success", response.success}};
    if (!response.server_id.empty()) {
        j["server_id"] = response.server_id;
    }
    if (response.port != 0) {
        j["port"] = response.port;
    }
    if (!response.error.empty()) {
        j["error"] = response.error;
    }
    if (!response.data.is_null()) {
        j["data"] = response.data;
    }
}

void from_json(const json& j, DaemonResponse& response) {
    response.success = j.value("success", false);
    response.server_id = j.value("server_id", "");
    response.port = j.value("port", 0);
    response.error = j.value("error", "");
    response.data = j.value("data", json());
}

DaemonRequest parse_request(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw std::invalid_argument("failed to decode request: not a JSON object");
        }
        return j.get<DaemonRequest>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("failed to decode request: ") + e.what());
    }
}

DaemonResponse parse_response(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw std::invalid_argument("failed to decode response: not a JSON object");
        }
        return j.get<DaemonResponse>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("failed to decode response: ") + e.what());
    }
}

} // namespace mcpgate
