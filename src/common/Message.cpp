#include "Message.hpp"
#include <nlohmann/json.hpp>

namespace mcpgate {

std::string_view to_string(Direction direction) {
    switch (direction) {
        case Direction::ClientToServer:
            return "client_to_server";
        case Direction::ServerToClient:
            return "server_to_client";
        case Direction::System:
        default:
            return "system";
    }
}

std::string_view to_string(MessageType type) {
    switch (type) {
        case MessageType::Request:
            return "request";
        case MessageType::Response:
            return "response";
        case MessageType::Notification:
            return "notification";
        case MessageType::System:
        default:
            return "system";
    }
}

std::string_view to_string(Transport transport) {
    switch (transport) {
        case Transport::Http:
            return "http";
        case Transport::Stdio:
        default:
            return "stdio";
    }
}

MessageType classify_frame(std::string_view raw, Direction direction) {
    if (direction == Direction::System) {
        return MessageType::System;
    }

    const MessageType fallback = direction == Direction::ClientToServer
        ? MessageType::Request
        : MessageType::Response;

    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return fallback;
    }

    if (parsed.contains("method")) {
        return parsed.contains("id") ? MessageType::Request : MessageType::Notification;
    }
    if (parsed.contains("result") || parsed.contains("error")) {
        return MessageType::Response;
    }
    return fallback;
}

} // namespace mcpgate
