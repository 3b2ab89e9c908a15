#pragma once

#include "processor/ProcessorTypes.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Raised for missing, unreadable, malformed or invalid configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Proxy-level settings ("proxy" object)
 */
struct ProxySettings {
    std::string host = "127.0.0.1";
    std::string port = "8080";
    int timeout = 30;          // downstream request timeout, seconds
    std::string log_level;
    std::string log_file;
};

/**
 * @brief One downstream tool server
 *
 * Exactly one of command (stdio) or url (http) is set.
 */
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    std::map<std::string, std::string> headers;
    bool enabled = true;
    std::string description;

    bool is_http() const { return !url.empty(); }

    /**
     * @brief Headers with ${VAR}/$VAR expanded from the environment
     */
    std::map<std::string, std::string> substituted_headers() const;
};

/**
 * @brief Named group of servers sharing an endpoint namespace
 */
struct GatewayConfig {
    std::map<std::string, ServerConfig> servers;   // "mcpServers"
    std::vector<ProcessorConfig> processors;
};

/**
 * @brief Root of the configuration file
 */
struct GlobalConfig {
    std::string name;
    std::string version;
    std::optional<ProxySettings> proxy;
    std::map<std::string, GatewayConfig> gateways;
    std::vector<ProcessorConfig> processors;
    json metadata = json::object();

    /**
     * @brief Global processors followed by the gateway's own
     */
    std::vector<ProcessorConfig> processors_for(const std::string& gateway) const;

    const ProxySettings& proxy_settings() const;
};

/**
 * @brief Parse and schema-validate configuration text
 * @throws ConfigError naming the offending field
 */
GlobalConfig parse_config(const std::string& text);

/**
 * @brief Read, parse and schema-validate a configuration file
 * @throws ConfigError if the file is missing, unreadable or invalid
 */
GlobalConfig load_config(const std::string& path);

/**
 * @brief Structural validation; empty gateway maps are allowed
 * @throws ConfigError
 */
void validate_schema(const GlobalConfig& config);

/**
 * @brief Validate a processor list (names unique, kind supported)
 * @throws ConfigError
 */
void validate_processors(const std::vector<ProcessorConfig>& processors);

/**
 * @brief Operational validation for the HTTP relay (needs a gateway)
 * @throws ConfigError
 */
void validate_for_server(const GlobalConfig& config);

/**
 * @brief Substitute ${VAR} and $VAR with environment values
 *
 * Unset variables expand to the empty string. A '$' not followed by a
 * variable name is kept as is.
 */
std::string expand_env(const std::string& text);

/**
 * @brief ~/.mcpgate
 */
std::string config_dir();

/**
 * @brief ~/.mcpgate/config.json
 */
std::string default_config_path();

} // namespace mcpgate
