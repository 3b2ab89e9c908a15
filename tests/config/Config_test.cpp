#include <gtest/gtest.h>
#include "config/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcpgate;
namespace fs = std::filesystem;

namespace {

json base_config() {
    return {
        {"name", "test"},
        {"version", "1.0"},
        {"proxy", {{"host", "127.0.0.1"}, {"port", "9000"}}},
        {"gateways", {
            {"main", {
                {"mcpServers", {
                    {"remote", {{"url", "http://127.0.0.1:7000/mcp"}, {"headers", {{"Authorization", "Bearer ${MCPGATE_TEST_TOKEN}"}}}}},
                    {"local", {{"command", "echo-server"}, {"args", {"--verbose"}}}}
                }},
                {"processors", {
                    {{"name", "gw-check"}, {"type", "cli"}, {"config", {{"command", "check"}}}}
                }}
            }}
        }},
        {"processors", {
            {{"name", "global-log"}, {"type", "cli"}, {"config", {{"command", "log"}, {"args", {"-v"}}}}}
        }}
    };
}

/// Expect parse_config to fail with a message containing text
void expect_rejected(const json& config, const std::string& text) {
    try {
        parse_config(config.dump());
        FAIL() << "expected ConfigError containing: " << text;
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find(text), std::string::npos) << e.what();
    }
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "mcpgate_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
        unsetenv("MCPGATE_TEST_TOKEN");
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(ConfigTest, ParsesFullConfig) {
    GlobalConfig config = parse_config(base_config().dump());

    EXPECT_EQ(config.name, "test");
    EXPECT_EQ(config.version, "1.0");
    ASSERT_TRUE(config.proxy.has_value());
    EXPECT_EQ(config.proxy->port, "9000");
    EXPECT_EQ(config.proxy->timeout, 30);

    ASSERT_EQ(config.gateways.size(), 1);
    const auto& servers = config.gateways.at("main").servers;
    ASSERT_EQ(servers.size(), 2);
    EXPECT_TRUE(servers.at("remote").is_http());
    EXPECT_FALSE(servers.at("local").is_http());
    EXPECT_EQ(servers.at("local").args, std::vector<std::string>{"--verbose"});
    EXPECT_TRUE(servers.at("local").enabled);

    ASSERT_EQ(config.processors.size(), 1);
    EXPECT_EQ(config.processors[0].name, "global-log");
    EXPECT_EQ(config.processors[0].timeout, kDefaultProcessorTimeout);
    EXPECT_TRUE(config.processors[0].enabled);
}

TEST_F(ConfigTest, GatewayChainRunsGlobalProcessorsFirst) {
    GlobalConfig config = parse_config(base_config().dump());

    auto chain = config.processors_for("main");
    ASSERT_EQ(chain.size(), 2);
    EXPECT_EQ(chain[0].name, "global-log");
    EXPECT_EQ(chain[1].name, "gw-check");

    EXPECT_EQ(config.processors_for("unknown").size(), 1);
}

TEST_F(ConfigTest, NumericPortAndDefaults) {
    json j = base_config();
    j["proxy"] = {{"port", 8123}};
    GlobalConfig config = parse_config(j.dump());

    EXPECT_EQ(config.proxy->port, "8123");
    EXPECT_EQ(config.proxy->host, "127.0.0.1");
}

TEST_F(ConfigTest, ZeroTimeoutBecomesDefault) {
    json j = base_config();
    j["processors"][0]["timeout"] = 0;
    GlobalConfig config = parse_config(j.dump());
    EXPECT_EQ(config.processors[0].timeout, 15);
}

TEST_F(ConfigTest, RejectsMissingVersion) {
    json j = base_config();
    j.erase("version");
    expect_rejected(j, "version field is required");
}

TEST_F(ConfigTest, RejectsMissingProxy) {
    json j = base_config();
    j.erase("proxy");
    expect_rejected(j, "proxy settings are required");
}

TEST_F(ConfigTest, RejectsUnsafeGatewayName) {
    json j = base_config();
    j["gateways"]["bad name"] = j["gateways"]["main"];
    expect_rejected(j, "name must be URL-safe");
}

TEST_F(ConfigTest, RejectsEmptyGateway) {
    json j = base_config();
    j["gateways"]["empty"] = {{"mcpServers", json::object()}};
    expect_rejected(j, "must have at least one MCP server");
}

TEST_F(ConfigTest, RejectsServerWithoutTransport) {
    json j = base_config();
    j["gateways"]["main"]["mcpServers"]["broken"] = {{"description", "nothing"}};
    expect_rejected(j, "must specify either 'command'");
}

TEST_F(ConfigTest, RejectsServerWithBothTransports) {
    json j = base_config();
    j["gateways"]["main"]["mcpServers"]["broken"] = {{"command", "x"}, {"url", "http://host"}};
    expect_rejected(j, "cannot specify both");
}

TEST_F(ConfigTest, RejectsBadUrl) {
    json j = base_config();
    j["gateways"]["main"]["mcpServers"]["remote"]["url"] = "ftp://host/path";
    expect_rejected(j, "invalid URL format");
}

TEST_F(ConfigTest, RejectsEmptyHeaderValue) {
    json j = base_config();
    j["gateways"]["main"]["mcpServers"]["remote"]["headers"] = {{"X-Key", ""}};
    expect_rejected(j, "has empty value");
}

TEST_F(ConfigTest, RejectsProcessorWithoutName) {
    json j = base_config();
    j["processors"].push_back({{"type", "cli"}, {"config", {{"command", "x"}}}});
    expect_rejected(j, "name is required");
}

TEST_F(ConfigTest, RejectsDuplicateProcessorName) {
    json j = base_config();
    j["processors"].push_back(j["processors"][0]);
    expect_rejected(j, "duplicate processor name");
}

TEST_F(ConfigTest, RejectsUnsupportedProcessorType) {
    json j = base_config();
    j["processors"][0]["type"] = "wasm";
    expect_rejected(j, "unsupported type 'wasm'");
}

TEST_F(ConfigTest, RejectsProcessorWithoutCommand) {
    json j = base_config();
    j["processors"][0]["config"] = json::object();
    expect_rejected(j, "config.command is required");
}

TEST_F(ConfigTest, RejectsProcessorWithoutConfig) {
    json j = base_config();
    j["processors"][0].erase("config");
    expect_rejected(j, "config is required");
}

TEST_F(ConfigTest, RejectsNonStringArgs) {
    json j = base_config();
    j["processors"][0]["config"]["args"] = {1, 2};
    expect_rejected(j, "config.args must contain only strings");
}

TEST_F(ConfigTest, GatewayProcessorErrorsNameTheGateway) {
    json j = base_config();
    j["gateways"]["main"]["processors"][0]["type"] = "";
    expect_rejected(j, "gateway 'main'");
}

TEST_F(ConfigTest, MalformedJson) {
    EXPECT_THROW(parse_config("{not json"), ConfigError);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("config.json", base_config().dump(2));
    GlobalConfig config = load_config(path);
    EXPECT_EQ(config.name, "test");
}

TEST_F(ConfigTest, LoadMissingFile) {
    try {
        load_config((test_dir_ / "missing.json").string());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("configuration file not found"), std::string::npos);
    }
}

TEST_F(ConfigTest, ServerModeNeedsGateway) {
    json j = base_config();
    j.erase("gateways");
    GlobalConfig config = parse_config(j.dump());
    EXPECT_THROW(validate_for_server(config), ConfigError);
}

TEST_F(ConfigTest, ExpandEnv) {
    setenv("MCPGATE_TEST_TOKEN", "secret", 1);
    EXPECT_EQ(expand_env("Bearer ${MCPGATE_TEST_TOKEN}"), "Bearer secret");
    EXPECT_EQ(expand_env("$MCPGATE_TEST_TOKEN-x"), "secret-x");
    EXPECT_EQ(expand_env("cost $5"), "cost ");
    EXPECT_EQ(expand_env("plain"), "plain");
    EXPECT_EQ(expand_env("trailing $"), "trailing $");
}

TEST_F(ConfigTest, SubstitutedHeaders) {
    setenv("MCPGATE_TEST_TOKEN", "abc", 1);
    GlobalConfig config = parse_config(base_config().dump());
    auto headers = config.gateways.at("main").servers.at("remote").substituted_headers();
    EXPECT_EQ(headers.at("Authorization"), "Bearer abc");
}
