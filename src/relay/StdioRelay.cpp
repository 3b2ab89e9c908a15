#include "StdioRelay.hpp"
#include "common/Util.hpp"
#include "transport/PipeTransport.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpgate {

namespace {

constexpr std::chrono::milliseconds kStderrDrainTimeout{500};

} // namespace

std::string_view to_string(StdioRelay::State state) {
    switch (state) {
        case StdioRelay::State::Created:
            return "created";
        case StdioRelay::State::Started:
            return "started";
        case StdioRelay::State::Stopping:
            return "stopping";
        case StdioRelay::State::Stopped:
        default:
            return "stopped";
    }
}

StdioRelay::StdioRelay(StdioRelayOptions options, std::shared_ptr<ITransport> client)
    : options_(std::move(options)),
      client_(std::move(client)),
      session_id_("session_" + std::to_string(unix_nanos())),
      server_id_(options_.server_id.empty()
                     ? "stdio_" + options_.command + "_" + std::to_string(unix_nanos())
                     : options_.server_id),
      chain_(std::make_shared<Chain>(options_.processors,
                                     options_.server_name.empty() ? options_.command : options_.server_name,
                                     session_id_,
                                     Transport::Stdio)),
      processor_(chain_, options_.event_logger) {
    if (options_.command.empty()) {
        throw std::invalid_argument("Command cannot be empty");
    }
    if (!client_) {
        throw std::invalid_argument("Client transport cannot be null");
    }
}

StdioRelay::~StdioRelay() {
    stop();
    if (supervisor_thread_.joinable()) {
        supervisor_thread_.join();
    }
}

void StdioRelay::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != State::Created) {
        throw std::logic_error("Relay already started");
    }

    ProcessSpec spec;
    spec.command = options_.command;
    spec.args = options_.args;
    spec.env = options_.env;

    process_ = std::make_unique<Subprocess>(spec);
    process_->start();

    server_in_ = std::make_unique<PipeTransport>(-1, process_->stdin_fd());
    server_out_ = std::make_unique<PipeTransport>(process_->stdout_fd(), -1);
    server_err_ = std::make_unique<PipeTransport>(process_->stderr_fd(), -1);

    state_ = State::Started;

    client_thread_ = std::thread(&StdioRelay::client_to_server_loop, this);
    server_thread_ = std::thread(&StdioRelay::server_to_client_loop, this);
    stderr_thread_ = std::thread(&StdioRelay::stderr_loop, this);
    supervisor_thread_ = std::thread(&StdioRelay::supervise, this);

    spdlog::info("Stdio relay {} started: {} (pid={}, {} processors)", server_id_,
                 options_.command, process_->pid(), options_.processors.size());
    log_system_event("Stdio relay started: " + options_.command);
}

void StdioRelay::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Created || state_ == State::Stopped) {
            return;
        }
    }

    spdlog::debug("Stop requested for relay {}", server_id_);
    request_shutdown(false);
    wait();
}

void StdioRelay::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ == State::Created || state_ == State::Stopped; });
}

bool StdioRelay::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [this] { return state_ == State::Created || state_ == State::Stopped; });
}

StdioRelay::State StdioRelay::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<int> StdioRelay::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->exit_code() : std::nullopt;
}

pid_t StdioRelay::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->pid() : -1;
}

void StdioRelay::request_shutdown(bool drain) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shutdown_requested_) {
        shutdown_requested_ = true;
        drain_ = drain;
    } else if (!drain) {
        drain_ = false;
    }
    cv_.notify_all();
}

bool StdioRelay::write_to_client(const std::string& frame) {
    std::lock_guard<std::mutex> lock(client_write_mutex_);
    return client_->write_frame(frame);
}

Message StdioRelay::make_message(Direction direction, std::string raw) const {
    Message message;
    message.direction = direction;
    message.type = classify_frame(raw, direction);
    message.raw = std::move(raw);
    message.transport = Transport::Stdio;
    message.session_id = session_id_;
    message.command = options_.command;
    message.args = options_.args;
    return message;
}

McpEvent StdioRelay::make_event() const {
    McpEvent event;
    event.server_id = server_id_;
    event.transport = Transport::Stdio;
    event.command = options_.command;
    event.args = options_.args;
    return event;
}

void StdioRelay::log_system_event(const std::string& text) {
    if (!options_.event_logger) {
        return;
    }
    McpEvent event = make_event();
    event.timestamp = rfc3339_now();
    event.session_id = session_id_;
    event.request_id = "system_event_" + std::to_string(unix_nanos());
    event.direction = Direction::System;
    event.message_type = MessageType::System;
    event.raw_message = text;
    options_.event_logger->log_event(event);
}

void StdioRelay::client_to_server_loop() {
    while (auto frame = client_->read_frame()) {
        if (frame->empty()) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_requested_ && !drain_) {
                return;
            }
        }

        FrameDecision decision;
        try {
            decision = processor_.process(make_message(Direction::ClientToServer, *frame), make_event());
        } catch (const std::exception& e) {
            spdlog::error("Relay {}: failed to process client frame: {}", server_id_, e.what());
            request_shutdown(false);
            return;
        }
        switch (decision.action) {
            case FrameAction::Forward:
                if (!server_in_->write_frame(decision.frame)) {
                    spdlog::warn("Relay {}: failed to write to server stdin", server_id_);
                    request_shutdown(false);
                    return;
                }
                break;
            case FrameAction::Reply:
                if (!write_to_client(decision.frame)) {
                    spdlog::warn("Relay {}: failed to write to client", server_id_);
                    request_shutdown(false);
                    return;
                }
                break;
            case FrameAction::Drop:
                break;
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdown_requested_) {
        return;
    }
    lock.unlock();

    spdlog::info("Relay {}: client closed input, closing server stdin", server_id_);
    process_->close_stdin();
    request_shutdown(true);
}

void StdioRelay::server_to_client_loop() {
    while (auto frame = server_out_->read_frame()) {
        if (frame->empty()) {
            continue;
        }

        FrameDecision decision;
        try {
            decision = processor_.process(make_message(Direction::ServerToClient, *frame), make_event());
        } catch (const std::exception& e) {
            spdlog::error("Relay {}: failed to process server frame: {}", server_id_, e.what());
            break;
        }
        if (decision.action == FrameAction::Drop) {
            continue;
        }
        if (!write_to_client(decision.frame)) {
            spdlog::warn("Relay {}: failed to write to client", server_id_);
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        server_done_ = true;
    }
    spdlog::debug("Relay {}: server output closed", server_id_);
    request_shutdown(false);
}

void StdioRelay::stderr_loop() {
    while (auto line = server_err_->read_frame()) {
        if (!line->empty()) {
            spdlog::info("[{} stderr] {}", options_.command, *line);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stderr_done_ = true;
    cv_.notify_all();
}

void StdioRelay::supervise() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return shutdown_requested_; });

    if (drain_) {
        // Client is gone; give the server time to answer what it already has
        cv_.wait_for(lock, options_.stop_grace, [this] { return server_done_ || !drain_; });
    }
    state_ = State::Stopping;
    cv_.notify_all();
    lock.unlock();

    spdlog::debug("Relay {} stopping", server_id_);

    client_->close();
    server_out_->close();
    server_in_->close();

    process_->terminate(options_.stop_grace);

    if (client_thread_.joinable()) {
        client_thread_.join();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    lock.lock();
    cv_.wait_for(lock, kStderrDrainTimeout, [this] { return stderr_done_; });
    lock.unlock();
    server_err_->close();
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    int code = process_->exit_code().value_or(-1);
    spdlog::info("Stdio relay {} stopped (exit code {})", server_id_, code);
    log_system_event("Stdio relay stopped: " + options_.command);

    lock.lock();
    state_ = State::Stopped;
    cv_.notify_all();
}

} // namespace mcpgate
