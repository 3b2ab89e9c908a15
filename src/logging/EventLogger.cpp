#include "EventLogger.hpp"
#include "config/Config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace mcpgate {

void to_json(json& j, const McpEvent& event) {
    j = {
        {"timestamp", event.timestamp},
        {"transport", to_string(event.transport)},
        {"request_id", event.request_id},
        {"direction", to_string(event.direction)},
        {"message_type", to_string(event.message_type)},
        {"success", event.success},
        {"modified", event.modified},
        {"status", event.status},
        {"raw_message", event.raw_message}
    };

    if (!event.session_id.empty()) {
        j["session_id"] = event.session_id;
    }
    if (!event.server_id.empty()) {
        j["server_id"] = event.server_id;
    }
    if (!event.error.empty()) {
        j["error"] = event.error;
    }

    json routing = json::object();
    if (event.transport == Transport::Stdio) {
        routing["command"] = event.command;
        routing["args"] = event.args;
    } else {
        routing["gateway"] = event.gateway;
        routing["server_name"] = event.server_name;
        routing["endpoint"] = event.endpoint;
        routing["downstream_url"] = event.downstream_url;
    }
    j["routing"] = routing;
}

JsonlEventLogger::JsonlEventLogger(const std::string& path)
    : path_(path) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_);
        logger_ = std::make_shared<spdlog::logger>("events", sink);
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error("Failed to open event log " + path_ + ": " + e.what());
    }
    spdlog::debug("Event log: {}", path_);
}

JsonlEventLogger::~JsonlEventLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void JsonlEventLogger::log_event(const McpEvent& event) {
    try {
        logger_->info("{}", json(event).dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (const std::exception& e) {
        spdlog::warn("Failed to write event to {}: {}", path_, e.what());
    }
}

std::string JsonlEventLogger::default_path() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &local);

    std::filesystem::path dir = std::filesystem::path(config_dir()) / "logs";
    return (dir / ("requests_" + std::string(date) + ".jsonl")).string();
}

} // namespace mcpgate
