#include "ProcessorTypes.hpp"

namespace mcpgate {

void to_json(json& j, const ProcessorConfig& config) {
    j = {
        {"name", config.name},
        {"type", config.type},
        {"enabled", config.enabled},
        {"timeout", config.timeout},
        {"config", config.config}
    };
}

void from_json(const json& j, ProcessorConfig& config) {
    config.name = j.value("name", "");
    config.type = j.value("type", "");
    config.enabled = j.value("enabled", true);
    config.timeout = j.value("timeout", 0);
    if (config.timeout <= 0) {
        config.timeout = kDefaultProcessorTimeout;
    }
    config.config = j.value("config", json());
}

void to_json(json& j, const ConnectionContext& connection) {
    j = {
        {"server_name", connection.server_name},
        {"transport", connection.transport},
        {"session_id", connection.session_id}
    };
}

void to_json(json& j, const ProcessorInput& input) {
    j = {
        {"type", input.type},
        {"timestamp", input.timestamp},
        {"connection", input.connection},
        {"payload", input.payload},
        {"metadata", {
            {"processor_chain", input.processor_chain},
            {"original_payload", input.original_payload}
        }}
    };
}

void to_json(json& j, const ProcessorOutput& output) {
    j = {
        {"status", output.status},
        {"payload", output.payload},
        {"error", output.error ? json(*output.error) : json(nullptr)}
    };
    if (!output.metadata.is_null()) {
        j["metadata"] = output.metadata;
    }
}

} // namespace mcpgate
