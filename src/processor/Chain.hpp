#pragma once

#include "Executor.hpp"
#include "ProcessorTypes.hpp"
#include "common/Message.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Raised when a message body is not a JSON object
 */
class PayloadParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Outcome of running a chain over one message
 */
struct ChainResult {
    int status = 200;
    json payload = json::object();
    std::optional<std::string> error;
    std::vector<std::string> processor_chain;   // processors that ran, in order
    json metadata = json::object();             // processor name -> metadata

    bool ok() const { return status < 400; }
};

/**
 * @brief Ordered sequence of processors applied to every message of a relay
 *
 * Processors run one after another on the working payload. The first
 * status >= 400 ends the run. Disabled processors are skipped.
 */
class Chain {
public:
    /**
     * @brief Construct chain
     * @param processors Processor configurations in execution order
     * @param server_name Downstream server name reported to processors
     * @param session_id Relay session reported to processors
     * @param transport Relay transport reported to processors
     * @param executor Executor used for each processor
     */
    Chain(std::vector<ProcessorConfig> processors,
          std::string server_name,
          std::string session_id,
          Transport transport = Transport::Stdio,
          Executor executor = Executor());

    /**
     * @brief Run the chain over a message body
     * @param type Message kind reported to processors
     * @param raw JSON text of the message
     * @throws PayloadParseError if raw is not a JSON object
     */
    ChainResult execute(MessageType type, const std::string& raw) const;

    /**
     * @brief Run the chain over a framed message
     */
    ChainResult execute(const Message& message) const;

    ChainResult execute_request(const std::string& raw) const {
        return execute(MessageType::Request, raw);
    }

    ChainResult execute_response(const std::string& raw) const {
        return execute(MessageType::Response, raw);
    }

    /**
     * @brief True if at least one processor is enabled
     */
    bool has_processors() const;

    const std::vector<ProcessorConfig>& processors() const { return processors_; }
    const std::string& server_name() const { return server_name_; }
    const std::string& session_id() const { return session_id_; }

    /**
     * @brief Build the JSON-RPC error envelope for a failed result
     * @param result Result with status >= 400
     * @param id Id of the message being answered (null if unknown)
     * @throws std::logic_error if result is not an error
     */
    static json format_error(const ChainResult& result, const json& id);

private:
    std::vector<ProcessorConfig> processors_;
    std::string server_name_;
    std::string session_id_;
    Transport transport_;
    Executor executor_;
};

} // namespace mcpgate
