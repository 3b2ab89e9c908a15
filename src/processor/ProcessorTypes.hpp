#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

using json = nlohmann::json;

/// Default per-invocation processor timeout in seconds
constexpr int kDefaultProcessorTimeout = 15;

/**
 * @brief Raised when a processor cannot be invoked at all
 *
 * Disabled processors and unsupported kinds end up here. Processor
 * misbehavior (bad output, timeout, crash) is not an exception; it becomes a
 * synthesized 500 ProcessorOutput.
 */
class ProcessorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One configured processor
 *
 * For kind "cli" the config object carries "command" (string) and an
 * optional "args" (array of strings).
 */
struct ProcessorConfig {
    std::string name;
    std::string type = "cli";
    bool enabled = true;
    int timeout = kDefaultProcessorTimeout;  // seconds
    json config = json::object();
};

/**
 * @brief Identifies the relay a message belongs to
 */
struct ConnectionContext {
    std::string server_name;
    std::string transport;
    std::string session_id;
};

/**
 * @brief Document written to a processor's stdin
 */
struct ProcessorInput {
    std::string type;        // "request" or "response"
    std::string timestamp;   // RFC 3339 UTC
    ConnectionContext connection;
    json payload = json::object();
    std::vector<std::string> processor_chain;   // processors already run
    json original_payload = json::object();
};

/**
 * @brief Document read back from a processor's stdout
 */
struct ProcessorOutput {
    int status = 200;
    json payload = json::object();
    std::optional<std::string> error;
    json metadata;           // null when the processor returned none

    bool ok() const { return status < 400; }
};

void to_json(json& j, const ProcessorConfig& config);
void from_json(const json& j, ProcessorConfig& config);

void to_json(json& j, const ConnectionContext& connection);
void to_json(json& j, const ProcessorInput& input);
void to_json(json& j, const ProcessorOutput& output);

} // namespace mcpgate
