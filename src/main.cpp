#include "config/Config.hpp"
#include "daemon/Daemon.hpp"
#include "daemon/DaemonClient.hpp"
#include "logging/EventLogger.hpp"
#include "logging/Logging.hpp"
#include "relay/HttpRelay.hpp"
#include "relay/StdioRelay.hpp"
#include "transport/PipeTransport.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

namespace {
    constexpr const char* kVersion = "mcpgate version 1.0.0";
    constexpr auto kPollInterval = std::chrono::milliseconds(200);

    std::atomic<bool> shutdown_requested{false};

    void signal_handler(int) {
        shutdown_requested = true;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    /**
     * @brief Load the given config, or the default one if it exists
     * @return nullopt if no path was given and no default file exists
     */
    std::optional<mcpgate::GlobalConfig> load_optional_config(const std::string& path) {
        if (!path.empty()) {
            return mcpgate::load_config(path);
        }
        const std::string fallback = mcpgate::default_config_path();
        if (std::filesystem::exists(fallback)) {
            spdlog::debug("Using configuration {}", fallback);
            return mcpgate::load_config(fallback);
        }
        return std::nullopt;
    }

    std::shared_ptr<mcpgate::IEventLogger> make_event_logger() {
        const std::string path = mcpgate::JsonlEventLogger::default_path();
        try {
            auto logger = std::make_shared<mcpgate::JsonlEventLogger>(path);
            spdlog::info("Activity log: {}", path);
            return logger;
        } catch (const std::runtime_error& e) {
            spdlog::warn("Activity log disabled: {}", e.what());
            return std::make_shared<mcpgate::NullEventLogger>();
        }
    }

    /// Config's proxy.logLevel/logFile apply unless --log-level was given
    void apply_config_logging(const std::optional<mcpgate::GlobalConfig>& config, bool level_from_cli,
                              const std::string& cli_level) {
        if (!config || !config->proxy) {
            return;
        }
        const auto& proxy = *config->proxy;
        std::string level = cli_level;
        if (!level_from_cli && !proxy.log_level.empty()) {
            level = proxy.log_level;
        }
        if (level != cli_level || !proxy.log_file.empty()) {
            mcpgate::configure_logging(level, proxy.log_file);
        }
    }

    int run_stdio(std::string command, std::vector<std::string> args, const std::string& config_path,
                  bool no_daemon, bool level_from_cli, const std::string& log_level) {
        if (command.empty() && !args.empty()) {
            command = args.front();
            args.erase(args.begin());
        }
        if (command.empty()) {
            std::cerr << "Error: command is required (--cmd or first argument)" << std::endl;
            return 1;
        }

        if (!no_daemon && mcpgate::DaemonClient::is_daemon_running()) {
            std::string absolute_config;
            if (!config_path.empty()) {
                absolute_config = std::filesystem::absolute(config_path).string();
            }
            mcpgate::DaemonClient client;
            auto response = client.start_stdio(command, args, absolute_config);
            if (!response.success) {
                std::cerr << "Error: " << response.error << std::endl;
                return 1;
            }
            std::cout << "Started stdio proxy in daemon: " << response.server_id << std::endl;
            return 0;
        }

        auto config = load_optional_config(config_path);
        apply_config_logging(config, level_from_cli, log_level);

        mcpgate::StdioRelayOptions options;
        options.command = command;
        options.args = args;
        options.event_logger = make_event_logger();
        if (config) {
            options.processors = config->processors;
            options.server_name = config->name;
        }

        auto client = std::make_shared<mcpgate::PipeTransport>(STDIN_FILENO, STDOUT_FILENO);
        mcpgate::StdioRelay relay(std::move(options), client);
        relay.start();

        while (!relay.wait_for(kPollInterval)) {
            if (shutdown_requested) {
                spdlog::info("Shutdown requested, stopping relay");
                relay.stop();
                break;
            }
        }
        relay.wait();

        if (auto code = relay.exit_code()) {
            spdlog::info("Tool server exited with status {}", *code);
        }
        return 0;
    }

    int run_daemon_start(const std::string& config_path, bool level_from_cli, const std::string& log_level) {
        auto config = load_optional_config(config_path);
        apply_config_logging(config, level_from_cli, log_level);

        mcpgate::DaemonOptions options;
        options.config = config;
        options.event_logger = make_event_logger();

        mcpgate::Daemon daemon(std::move(options));
        try {
            daemon.start();
        } catch (const mcpgate::DaemonAlreadyRunningError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        while (!daemon.wait_for(kPollInterval)) {
            if (shutdown_requested) {
                spdlog::info("Shutdown requested");
                daemon.shutdown();
                break;
            }
        }
        daemon.wait();
        return 0;
    }

    int run_daemon_stop() {
        if (!mcpgate::DaemonClient::is_daemon_running()) {
            std::cerr << "Error: daemon is not running" << std::endl;
            return 1;
        }
        auto response = mcpgate::DaemonClient().stop();
        if (!response.success) {
            std::cerr << "Error: " << response.error << std::endl;
            return 1;
        }
        std::cout << "Daemon stopping" << std::endl;
        return 0;
    }

    int run_daemon_status() {
        if (!mcpgate::DaemonClient::is_daemon_running()) {
            std::cout << "Daemon is not running" << std::endl;
            return 1;
        }
        auto response = mcpgate::DaemonClient().status();
        if (!response.success) {
            std::cerr << "Error: " << response.error << std::endl;
            return 1;
        }
        std::cout << response.data.dump(2) << std::endl;
        return 0;
    }

    int run_server_start(const std::string& config_path, bool level_from_cli, const std::string& log_level) {
        auto config = mcpgate::load_config(config_path.empty() ? mcpgate::default_config_path() : config_path);
        apply_config_logging(config, level_from_cli, log_level);

        mcpgate::HttpRelay relay(std::move(config), make_event_logger());
        relay.start();

        while (!relay.wait_for(kPollInterval)) {
            if (shutdown_requested) {
                spdlog::info("Shutdown requested");
                relay.stop();
                break;
            }
        }
        relay.wait();
        return 0;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"mcpgate - MCP proxy that routes tool traffic through processor chains"};

    std::string log_level = "info";
    auto* level_option = app.add_option("-l,--log-level", log_level,
                                        "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    // stdio
    auto* stdio = app.add_subcommand("stdio", "Relay a stdio tool server (use -- before its arguments)");
    std::string stdio_command;
    std::string stdio_config;
    bool no_daemon = false;
    std::vector<std::string> stdio_args;
    stdio->add_option("--cmd", stdio_command, "Tool server command");
    stdio->add_option("--config", stdio_config, "Configuration file");
    stdio->add_flag("--no-daemon", no_daemon, "Run in this process even if a daemon is running");
    stdio->add_option("args", stdio_args, "Command (if --cmd is not given) and its arguments");

    // daemon start|stop|status
    auto* daemon = app.add_subcommand("daemon", "Manage the background daemon");
    daemon->require_subcommand(1);
    auto* daemon_start = daemon->add_subcommand("start", "Run the daemon in the foreground");
    std::string daemon_config;
    daemon_start->add_option("--config", daemon_config, "Configuration file");
    auto* daemon_stop = daemon->add_subcommand("stop", "Stop the running daemon");
    auto* daemon_status = daemon->add_subcommand("status", "Show daemon status");

    // server start
    auto* server = app.add_subcommand("server", "HTTP relay");
    server->require_subcommand(1);
    auto* server_start = server->add_subcommand("start", "Serve configured HTTP gateways");
    std::string server_config;
    server_start->add_option("--config", server_config, "Configuration file");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << kVersion << std::endl;
        return 0;
    }

    try {
        mcpgate::configure_logging(log_level);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    const bool level_from_cli = level_option->count() > 0;

    try {
        setup_signal_handlers();

        if (stdio->parsed()) {
            return run_stdio(stdio_command, stdio_args, stdio_config, no_daemon, level_from_cli, log_level);
        }
        if (daemon_start->parsed()) {
            return run_daemon_start(daemon_config, level_from_cli, log_level);
        }
        if (daemon_stop->parsed()) {
            return run_daemon_stop();
        }
        if (daemon_status->parsed()) {
            return run_daemon_status();
        }
        if (server_start->parsed()) {
            return run_server_start(server_config, level_from_cli, log_level);
        }

        std::cerr << app.help() << std::endl;
        return 1;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
