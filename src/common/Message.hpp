#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcpgate {

/**
 * @brief Which way a frame travels through a relay
 */
enum class Direction {
    ClientToServer,
    ServerToClient,
    System
};

/**
 * @brief Logical kind of a frame
 */
enum class MessageType {
    Request,
    Response,
    Notification,
    System
};

/**
 * @brief Transport a relay speaks toward its downstream server
 */
enum class Transport {
    Stdio,
    Http
};

std::string_view to_string(Direction direction);
std::string_view to_string(MessageType type);
std::string_view to_string(Transport transport);

/**
 * @brief One framed JSON document on one connection
 *
 * Carries the raw text exactly as read; relays parse it only through the
 * processor chain.
 */
struct Message {
    Direction direction = Direction::ClientToServer;
    MessageType type = MessageType::Request;
    std::string raw;
    Transport transport = Transport::Stdio;
    std::string session_id;

    // Originating command line (stdio only)
    std::string command;
    std::vector<std::string> args;
};

/**
 * @brief Classify a raw JSON-RPC frame
 *
 * Frames with a method and an id are requests, frames with a method and no
 * id are notifications, everything else is a response. Unparseable frames
 * fall back to request/response based on direction.
 */
MessageType classify_frame(std::string_view raw, Direction direction);

} // namespace mcpgate
