#include "Config.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpgate {

namespace fs = std::filesystem;

namespace {

std::string string_field(const json& object, const char* key, const std::string& context) {
    if (!object.contains(key) || object[key].is_null()) {
        return "";
    }
    if (!object[key].is_string()) {
        throw ConfigError(context + ": '" + key + "' must be a string");
    }
    return object[key].get<std::string>();
}

std::vector<std::string> string_list(const json& object, const char* key, const std::string& context) {
    std::vector<std::string> values;
    if (!object.contains(key) || object[key].is_null()) {
        return values;
    }
    if (!object[key].is_array()) {
        throw ConfigError(context + ": '" + key + "' must be an array of strings");
    }
    for (const auto& item : object[key]) {
        if (!item.is_string()) {
            throw ConfigError(context + ": '" + key + "' must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::map<std::string, std::string> string_map(const json& object, const char* key,
                                              const std::string& context) {
    std::map<std::string, std::string> values;
    if (!object.contains(key) || object[key].is_null()) {
        return values;
    }
    if (!object[key].is_object()) {
        throw ConfigError(context + ": '" + key + "' must be an object of strings");
    }
    for (const auto& [name, value] : object[key].items()) {
        if (!value.is_string()) {
            throw ConfigError(context + ": '" + key + "." + name + "' must be a string");
        }
        values[name] = value.get<std::string>();
    }
    return values;
}

std::vector<ProcessorConfig> parse_processors(const json& object, const std::string& context) {
    std::vector<ProcessorConfig> processors;
    if (!object.contains("processors") || object["processors"].is_null()) {
        return processors;
    }
    if (!object["processors"].is_array()) {
        throw ConfigError(context + ": 'processors' must be an array");
    }

    size_t index = 0;
    for (const auto& item : object["processors"]) {
        if (!item.is_object()) {
            throw ConfigError(context + ": processor[" + std::to_string(index) + "] must be an object");
        }
        try {
            processors.push_back(item.get<ProcessorConfig>());
        } catch (const json::exception& e) {
            throw ConfigError(context + ": processor[" + std::to_string(index) + "]: " + e.what());
        }
        ++index;
    }
    return processors;
}

ProxySettings parse_proxy(const json& object) {
    if (!object.is_object()) {
        throw ConfigError("'proxy' must be an object");
    }

    ProxySettings proxy;
    if (object.contains("host") && object["host"].is_string() && !object["host"].get<std::string>().empty()) {
        proxy.host = object["host"].get<std::string>();
    }
    if (object.contains("port")) {
        if (object["port"].is_string()) {
            if (!object["port"].get<std::string>().empty()) {
                proxy.port = object["port"].get<std::string>();
            }
        } else if (object["port"].is_number_integer()) {
            proxy.port = std::to_string(object["port"].get<int>());
        } else {
            throw ConfigError("proxy: 'port' must be a string or integer");
        }
    }
    if (object.contains("timeout")) {
        if (!object["timeout"].is_number_integer()) {
            throw ConfigError("proxy: 'timeout' must be an integer");
        }
        int timeout = object["timeout"].get<int>();
        if (timeout > 0) {
            proxy.timeout = timeout;
        }
    }
    proxy.log_level = string_field(object, "logLevel", "proxy");
    proxy.log_file = string_field(object, "logFile", "proxy");
    return proxy;
}

ServerConfig parse_server(const std::string& name, const json& object) {
    const std::string context = "server '" + name + "'";
    if (!object.is_object()) {
        throw ConfigError(context + ": must be an object");
    }

    ServerConfig server;
    server.name = name;
    server.command = string_field(object, "command", context);
    server.args = string_list(object, "args", context);
    server.env = string_map(object, "env", context);
    server.url = string_field(object, "url", context);
    server.headers = string_map(object, "headers", context);
    server.description = string_field(object, "description", context);

    if (object.contains("enabled") && !object["enabled"].is_null()) {
        if (!object["enabled"].is_boolean()) {
            throw ConfigError(context + ": 'enabled' must be a boolean");
        }
        server.enabled = object["enabled"].get<bool>();
    }
    return server;
}

GatewayConfig parse_gateway(const std::string& name, const json& object) {
    const std::string context = "gateway '" + name + "'";
    if (!object.is_object()) {
        throw ConfigError(context + ": must be an object");
    }

    GatewayConfig gateway;
    if (object.contains("mcpServers") && !object["mcpServers"].is_null()) {
        if (!object["mcpServers"].is_object()) {
            throw ConfigError(context + ": 'mcpServers' must be an object");
        }
        for (const auto& [server_name, server] : object["mcpServers"].items()) {
            gateway.servers[server_name] = parse_server(server_name, server);
        }
    }
    gateway.processors = parse_processors(object, context);
    return gateway;
}

bool is_valid_http_url(const std::string& url) {
    std::string rest;
    if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else if (url.rfind("https://", 0) == 0) {
        rest = url.substr(8);
    } else {
        return false;
    }
    auto end = rest.find_first_of("/?#");
    return !rest.substr(0, end).empty();
}

void validate_server(const std::string& name, const ServerConfig& server) {
    if (!is_url_safe(name)) {
        throw ConfigError("server '" + name +
                          "': name must be URL-safe (alphanumeric, dash, underscore only)");
    }

    bool has_command = !server.command.empty();
    bool has_url = !server.url.empty();

    if (!has_command && !has_url) {
        throw ConfigError("server '" + name +
                          "': must specify either 'command' (stdio transport) or 'url' (http transport)");
    }
    if (has_command && has_url) {
        throw ConfigError("server '" + name +
                          "': cannot specify both 'command' and 'url' - choose either stdio or http transport");
    }
    if (has_url && !is_valid_http_url(server.url)) {
        throw ConfigError("server '" + name +
                          "': invalid URL format - must be a valid http:// or https:// URL");
    }

    for (const auto& [key, value] : server.headers) {
        if (key.empty()) {
            throw ConfigError("server '" + name + "': header keys cannot be empty");
        }
        if (value.empty()) {
            throw ConfigError("server '" + name + "': header '" + key + "' has empty value");
        }
    }
}

void validate_gateway(const std::string& name, const GatewayConfig& gateway) {
    if (!is_url_safe(name)) {
        throw ConfigError("gateway '" + name +
                          "': name must be URL-safe (alphanumeric, dash, underscore only)");
    }
    if (gateway.servers.empty()) {
        throw ConfigError("gateway '" + name + "': must have at least one MCP server");
    }

    try {
        validate_processors(gateway.processors);
    } catch (const ConfigError& e) {
        throw ConfigError("gateway '" + name + "': " + e.what());
    }

    for (const auto& [server_name, server] : gateway.servers) {
        validate_server(server_name, server);
    }
}

void validate_processor(size_t index, const ProcessorConfig& processor, std::set<std::string>& names) {
    if (processor.name.empty()) {
        throw ConfigError("processor[" + std::to_string(index) + "]: name is required");
    }

    const std::string context = "processor '" + processor.name + "'";
    if (!names.insert(processor.name).second) {
        throw ConfigError(context + ": duplicate processor name");
    }
    if (processor.type.empty()) {
        throw ConfigError(context + ": type is required");
    }
    if (processor.type != "cli") {
        throw ConfigError(context + ": unsupported type '" + processor.type + "' (only 'cli' is supported)");
    }
    if (!processor.config.is_object()) {
        throw ConfigError(context + ": config is required");
    }

    const json& settings = processor.config;
    if (!settings.contains("command")) {
        throw ConfigError(context + ": config.command is required for cli type");
    }
    if (!settings["command"].is_string()) {
        throw ConfigError(context + ": config.command must be a string");
    }
    if (settings.contains("args")) {
        if (!settings["args"].is_array()) {
            throw ConfigError(context + ": config.args must be an array");
        }
        for (const auto& arg : settings["args"]) {
            if (!arg.is_string()) {
                throw ConfigError(context + ": config.args must contain only strings");
            }
        }
    }
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw ConfigError("failed to get user home directory: HOME is not set");
    }
    return home;
}

} // namespace

std::map<std::string, std::string> ServerConfig::substituted_headers() const {
    std::map<std::string, std::string> result;
    for (const auto& [key, value] : headers) {
        result[key] = expand_env(value);
    }
    return result;
}

std::vector<ProcessorConfig> GlobalConfig::processors_for(const std::string& gateway) const {
    std::vector<ProcessorConfig> result = processors;
    auto it = gateways.find(gateway);
    if (it != gateways.end()) {
        result.insert(result.end(), it->second.processors.begin(), it->second.processors.end());
    }
    return result;
}

const ProxySettings& GlobalConfig::proxy_settings() const {
    static const ProxySettings defaults;
    return proxy ? *proxy : defaults;
}

GlobalConfig parse_config(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("failed to parse config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("failed to parse config: root must be an object");
    }

    GlobalConfig config;
    config.name = string_field(root, "name", "config");
    config.version = string_field(root, "version", "config");

    if (root.contains("proxy") && !root["proxy"].is_null()) {
        config.proxy = parse_proxy(root["proxy"]);
    }

    if (root.contains("gateways") && !root["gateways"].is_null()) {
        if (!root["gateways"].is_object()) {
            throw ConfigError("'gateways' must be an object");
        }
        for (const auto& [name, gateway] : root["gateways"].items()) {
            config.gateways[name] = parse_gateway(name, gateway);
        }
    }

    config.processors = parse_processors(root, "config");

    if (root.contains("metadata") && root["metadata"].is_object()) {
        config.metadata = root["metadata"];
    }

    try {
        validate_schema(config);
    } catch (const ConfigError& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return config;
}

GlobalConfig load_config(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ConfigError("configuration file not found at " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("failed to read config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("failed to read config file: " + path);
    }

    GlobalConfig config = parse_config(buffer.str());
    spdlog::debug("Loaded configuration from {} ({} gateways, {} processors)",
                  path, config.gateways.size(), config.processors.size());
    return config;
}

void validate_schema(const GlobalConfig& config) {
    if (config.version.empty()) {
        throw ConfigError("version field is required");
    }
    if (!config.proxy) {
        throw ConfigError("proxy settings are required in config");
    }
    for (const auto& [name, gateway] : config.gateways) {
        validate_gateway(name, gateway);
    }
    validate_processors(config.processors);
}

void validate_processors(const std::vector<ProcessorConfig>& processors) {
    std::set<std::string> names;
    for (size_t i = 0; i < processors.size(); ++i) {
        validate_processor(i, processors[i], names);
    }
}

void validate_for_server(const GlobalConfig& config) {
    if (config.gateways.empty()) {
        throw ConfigError("no gateways configured. Add at least one gateway with HTTP MCP servers in your config");
    }
}

std::string expand_env(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    auto is_name_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            result += text[i++];
            continue;
        }

        std::string name;
        size_t next;
        if (text[i + 1] == '{') {
            auto close = text.find('}', i + 2);
            if (close == std::string::npos) {
                result += text[i++];
                continue;
            }
            name = text.substr(i + 2, close - i - 2);
            next = close + 1;
        } else {
            size_t end = i + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            if (end == i + 1) {
                result += text[i++];
                continue;
            }
            name = text.substr(i + 1, end - i - 1);
            next = end;
        }

        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        i = next;
    }
    return result;
}

std::string config_dir() {
    return (fs::path(home_dir()) / ".mcpgate").string();
}

std::string default_config_path() {
    return (fs::path(config_dir()) / "config.json").string();
}

} // namespace mcpgate
