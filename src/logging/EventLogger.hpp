#pragma once

#include "common/Message.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace mcpgate {

using json = nlohmann::json;

/**
 * @brief One activity record of a relay
 */
struct McpEvent {
    std::string timestamp;           // RFC 3339 UTC
    std::string session_id;
    std::string server_id;
    Transport transport = Transport::Stdio;
    json request_id;                 // JSON-RPC id, null if none
    Direction direction = Direction::ClientToServer;
    MessageType message_type = MessageType::Request;
    bool success = true;
    std::string error;
    bool modified = false;
    int status = 200;
    std::string raw_message;

    // Routing: stdio
    std::string command;
    std::vector<std::string> args;

    // Routing: http
    std::string gateway;
    std::string server_name;
    std::string endpoint;
    std::string downstream_url;
};

void to_json(json& j, const McpEvent& event);

/**
 * @brief Sink for relay activity
 *
 * Implementations must not throw; failures go to the diagnostic log.
 */
class IEventLogger {
public:
    virtual ~IEventLogger() = default;
    virtual void log_event(const McpEvent& event) = 0;
};

/**
 * @brief Discards all events
 */
class NullEventLogger : public IEventLogger {
public:
    void log_event(const McpEvent&) override {}
};

/**
 * @brief Appends events as JSON lines to a file
 */
class JsonlEventLogger : public IEventLogger {
public:
    /**
     * @brief Open (or create) the log file
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit JsonlEventLogger(const std::string& path);
    ~JsonlEventLogger() override;

    void log_event(const McpEvent& event) override;

    const std::string& path() const { return path_; }

    /**
     * @brief ~/.mcpgate/logs/requests_<YYYY-MM-DD>.jsonl
     */
    static std::string default_path();

private:
    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpgate
