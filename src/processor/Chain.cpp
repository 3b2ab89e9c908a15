#include "Chain.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mcpgate {

namespace {

// Processors only distinguish the two directions of traffic
std::string processor_kind(MessageType type) {
    return type == MessageType::Response ? "response" : "request";
}

} // namespace

Chain::Chain(std::vector<ProcessorConfig> processors,
             std::string server_name,
             std::string session_id,
             Transport transport,
             Executor executor)
    : processors_(std::move(processors)),
      server_name_(std::move(server_name)),
      session_id_(std::move(session_id)),
      transport_(transport),
      executor_(std::move(executor)) {
}

bool Chain::has_processors() const {
    return std::any_of(processors_.begin(), processors_.end(),
                       [](const ProcessorConfig& p) { return p.enabled; });
}

ChainResult Chain::execute(const Message& message) const {
    MessageType type = message.direction == Direction::ServerToClient
        ? MessageType::Response
        : MessageType::Request;
    return execute(type, message.raw);
}

ChainResult Chain::execute(MessageType type, const std::string& raw) const {
    json payload;
    try {
        payload = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw PayloadParseError(std::string("failed to parse JSON payload: ") + e.what());
    }
    if (!payload.is_object()) {
        throw PayloadParseError("failed to parse JSON payload: not a JSON object");
    }

    ChainResult result;
    const json original_payload = payload;

    for (const auto& processor : processors_) {
        if (!processor.enabled) {
            continue;
        }

        ProcessorInput input;
        input.type = processor_kind(type);
        input.timestamp = rfc3339_now();
        input.connection = {server_name_, std::string(to_string(transport_)), session_id_};
        input.payload = payload;
        input.processor_chain = result.processor_chain;
        input.original_payload = original_payload;

        ProcessorOutput output;
        try {
            output = executor_.execute(processor, input);
        } catch (const ProcessorError& e) {
            spdlog::error("Processor '{}' could not run: {}", processor.name, e.what());
            result.status = 500;
            result.payload = payload;
            result.error = "processor '" + processor.name + "' execution failed: " + e.what();
            return result;
        }

        result.processor_chain.push_back(processor.name);
        if (!output.metadata.is_null()) {
            result.metadata[processor.name] = output.metadata;
        }

        if (output.status >= 400) {
            spdlog::info("Processor '{}' stopped {} with status {}", processor.name,
                         input.type, output.status);
            result.status = output.status;
            result.payload = output.payload;
            result.error = output.error;
            return result;
        }

        payload = std::move(output.payload);
    }

    result.status = 200;
    result.payload = std::move(payload);
    return result;
}

json Chain::format_error(const ChainResult& result, const json& id) {
    int code;
    std::string message;

    if (result.status >= 500) {
        code = -32603;
        message = "Request processing failed";
    } else if (result.status >= 400) {
        code = -32001;
        message = "Request rejected by processor";
    } else {
        throw std::logic_error("cannot format error for status " +
                               std::to_string(result.status) + " (not an error)");
    }

    json data = {
        {"processor_chain", result.processor_chain},
        {"metadata", result.metadata}
    };
    if (result.error) {
        data["rejection_reason"] = *result.error;
    }

    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message},
            {"data", data}
        }}
    };
}

} // namespace mcpgate
