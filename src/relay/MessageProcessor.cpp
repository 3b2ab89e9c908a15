#include "MessageProcessor.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>

namespace mcpgate {

MessageProcessor::MessageProcessor(std::shared_ptr<const Chain> chain,
                                   std::shared_ptr<IEventLogger> event_logger)
    : chain_(std::move(chain)), event_logger_(std::move(event_logger)) {
}

bool MessageProcessor::has_processors() const {
    return chain_ && chain_->has_processors();
}

FrameDecision MessageProcessor::process(const Message& message, McpEvent event) const {
    event.timestamp = rfc3339_now();
    event.session_id = message.session_id;
    event.transport = message.transport;
    event.direction = message.direction;
    event.message_type = message.type;
    event.raw_message = message.raw;

    FrameDecision decision;
    decision.frame = message.raw;

    json original = json::parse(message.raw, nullptr, false);
    const bool is_object = !original.is_discarded() && original.is_object();
    const bool has_id = is_object && original.contains("id");
    if (has_id) {
        event.request_id = original["id"];
    }

    if (!has_processors()) {
        record(event, decision);
        return decision;
    }

    ChainResult result;
    try {
        result = chain_->execute(message);
    } catch (const PayloadParseError& e) {
        spdlog::warn("Forwarding unparseable {} frame unchanged: {}", to_string(message.direction), e.what());
        record(event, decision);
        return decision;
    } catch (const std::exception& e) {
        spdlog::error("Processor chain failed: {}", e.what());
        result.status = 500;
        result.error = std::string("processor chain failed: ") + e.what();
    }

    decision.status = result.status;

    if (result.ok()) {
        if (result.payload != original) {
            decision.frame = result.payload.dump(-1, ' ', false, json::error_handler_t::replace);
            decision.modified = true;
            spdlog::debug("Frame modified by processors");
        }
        record(event, decision);
        return decision;
    }

    event.error = result.error.value_or("");

    if (!has_id) {
        spdlog::warn("Dropping {} without id rejected with status {}: {}",
                     to_string(message.type), result.status, event.error);
        decision.action = FrameAction::Drop;
        decision.frame.clear();
        record(event, decision);
        return decision;
    }

    spdlog::info("{} rejected with status {}", to_string(message.type), result.status);
    decision.frame = Chain::format_error(result, original["id"])
        .dump(-1, ' ', false, json::error_handler_t::replace);
    decision.modified = true;
    decision.action = message.direction == Direction::ServerToClient
        ? FrameAction::Forward
        : FrameAction::Reply;
    record(event, decision);
    return decision;
}

void MessageProcessor::record(McpEvent& event, const FrameDecision& decision) const {
    if (!event_logger_) {
        return;
    }
    event.status = decision.status;
    event.success = decision.status < 400;
    event.modified = decision.modified;
    if (decision.modified && decision.action != FrameAction::Drop) {
        event.raw_message = decision.frame;
    }
    event_logger_->log_event(event);
}

} // namespace mcpgate
