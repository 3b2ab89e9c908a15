#pragma once

#include "common/Message.hpp"
#include "logging/EventLogger.hpp"
#include "processor/Chain.hpp"
#include <memory>
#include <string>

namespace mcpgate {

/**
 * @brief What a relay should do with a processed frame
 */
enum class FrameAction {
    Forward,   // continue in the frame's direction
    Reply,     // send back toward the frame's origin instead
    Drop       // neither
};

struct FrameDecision {
    FrameAction action = FrameAction::Forward;
    std::string frame;
    int status = 200;
    bool modified = false;
};

/**
 * @brief Applies a processor chain to single frames for a relay
 *
 * Shared by the stdio and HTTP relays. Records one activity event per
 * frame.
 *
 * Rules:
 * - no enabled processors, or a body that is not a JSON object: forward
 *   the original bytes
 * - success: forward the resulting payload (original bytes if unchanged)
 * - failure of a request: reply with the error envelope; drop if the
 *   request carries no id
 * - failure of a response: forward the error envelope in its place; drop
 *   if the response carries no id
 */
class MessageProcessor {
public:
    /**
     * @brief Construct processor
     * @param chain Chain to apply (may be null: pass-through)
     * @param event_logger Activity sink (may be null)
     */
    MessageProcessor(std::shared_ptr<const Chain> chain,
                     std::shared_ptr<IEventLogger> event_logger);

    /**
     * @brief Process one frame
     * @param message Frame with direction and routing context
     * @param event Event prefilled with routing fields; completed and logged
     */
    FrameDecision process(const Message& message, McpEvent event = McpEvent()) const;

    bool has_processors() const;

private:
    void record(McpEvent& event, const FrameDecision& decision) const;

    std::shared_ptr<const Chain> chain_;
    std::shared_ptr<IEventLogger> event_logger_;
};

} // namespace mcpgate
