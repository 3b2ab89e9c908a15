#include "Daemon.hpp"
#include "common/Util.hpp"
#include "transport/PipeTransport.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mcpgate {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Daemon::Daemon(DaemonOptions options)
    : options_(std::move(options)),
      port_(options_.port),
      acceptor_(ioc_) {
}

Daemon::~Daemon() {
    shutdown();
    if (stop_thread_.joinable()) {
        stop_thread_.join();
    }
}

void Daemon::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_) {
        throw std::logic_error("Daemon already started");
    }

    boost::system::error_code ec;
    const tcp::endpoint ep{asio::ip::make_address(options_.bind_address, ec), options_.port};
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + options_.bind_address + "': " + ec.message());
    }

    const std::string where = options_.bind_address + ":" + std::to_string(options_.port);
    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        throw std::runtime_error("acceptor open failed: " + ec.message());
    }
    // Linux refuses a second listener on the port even with SO_REUSEADDR
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec == asio::error::address_in_use) {
        acceptor_.close(ec);
        throw DaemonAlreadyRunningError("daemon already running on " + where);
    }
    if (ec) {
        throw std::runtime_error("bind to " + where + " failed: " + ec.message());
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec == asio::error::address_in_use) {
        acceptor_.close(ec);
        throw DaemonAlreadyRunningError("daemon already running on " + where);
    }
    if (ec) {
        throw std::runtime_error("listen failed: " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();

    started_at_ = std::chrono::steady_clock::now();
    running_ = true;
    started_ = true;
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });

    spdlog::info("Daemon listening on {}:{}", options_.bind_address, port_);
}

void Daemon::shutdown() {
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (!started_) {
            return;
        }
        if (shutdown_started_) {
            cv_.wait(lock, [this] { return finished_; });
            return;
        }
        shutdown_started_ = true;
    }

    spdlog::info("Daemon shutting down");
    running_ = false;

    asio::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<std::shared_ptr<StdioRelay>> relays;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (const auto& [id, relay] : servers_) {
            relays.push_back(relay);
        }
    }
    for (auto& relay : relays) {
        spdlog::debug("Stopping relay {}", relay->server_id());
        relay->stop();
    }

    watchers_.join_all();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (int fd : open_sockets_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    connections_.join_all();

    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
    cv_.notify_all();
    spdlog::info("Daemon stopped");
}

void Daemon::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    cv_.wait(lock, [this] { return !started_ || finished_; });
}

bool Daemon::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !started_ || finished_; });
}

size_t Daemon::server_count() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return servers_.size();
}

std::vector<std::string> Daemon::server_ids() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, relay] : servers_) {
        ids.push_back(id);
    }
    return ids;
}

void Daemon::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted && acceptor_.is_open()) {
                spdlog::warn("accept error: {}", ec.message());
                do_accept();
            }
            return;
        }
        if (!running_) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            open_sockets_.insert(socket.native_handle());
        }
        connections_.spawn([this, socket = std::move(socket)]() mutable {
            handle_connection(std::move(socket));
        });
        do_accept();
    });
}

void Daemon::handle_connection(tcp::socket socket) {
    const int fd = socket.native_handle();
    boost::system::error_code ec;

    std::string line;
    asio::read_until(socket, asio::dynamic_buffer(line), '\n', ec);
    auto newline = line.find('\n');
    if (newline != std::string::npos) {
        line.erase(newline);
    }

    if (ec && ec != asio::error::eof) {
        spdlog::debug("control connection read error: {}", ec.message());
    } else if (!line.empty()) {
        DaemonResponse response;
        try {
            response = handle_request(parse_request(line));
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Bad control request: {}", e.what());
            response = DaemonResponse::failure(e.what());
        }

        const std::string out = json(response).dump() + "\n";
        asio::write(socket, asio::buffer(out), ec);
        if (ec) {
            spdlog::debug("control connection write error: {}", ec.message());
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_sockets_.erase(fd);
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
    socket.close(ec);
}

DaemonResponse Daemon::handle_request(const DaemonRequest& request) {
    spdlog::debug("Control request '{}' (id {})", request.type, request.id);

    if (request.type == request_type::kStdio) {
        return handle_stdio(request);
    }
    if (request.type == request_type::kStatus) {
        return handle_status(request);
    }
    if (request.type == request_type::kStop) {
        return handle_stop(request);
    }
    return DaemonResponse::failure("unknown request type: " + request.type);
}

std::shared_ptr<StdioRelay> Daemon::make_default_relay(const DaemonRequest& request,
                                                       const std::string& server_id) {
    StdioRelayOptions relay_options;
    relay_options.command = request.command;
    relay_options.args = request.args;
    relay_options.server_id = server_id;
    relay_options.event_logger = options_.event_logger;

    auto config_path = request.metadata.find("config");
    if (config_path != request.metadata.end() && !config_path->second.empty()) {
        GlobalConfig config = load_config(config_path->second);
        relay_options.processors = config.processors;
        relay_options.server_name = config.name;
    } else if (options_.config) {
        relay_options.processors = options_.config->processors;
        relay_options.server_name = options_.config->name;
    }

    // The daemon's own stdio is the client side of every relay it hosts
    auto client = std::make_shared<PipeTransport>(STDIN_FILENO, STDOUT_FILENO);
    return std::make_shared<StdioRelay>(std::move(relay_options), std::move(client));
}

DaemonResponse Daemon::handle_stdio(const DaemonRequest& request) {
    if (!running_) {
        return DaemonResponse::failure("daemon is shutting down");
    }
    if (request.command.empty()) {
        return DaemonResponse::failure("command is required");
    }

    const std::string server_id = make_id("stdio_" + request.command);

    std::shared_ptr<StdioRelay> relay;
    try {
        relay = options_.relay_factory ? options_.relay_factory(request, server_id)
                                       : make_default_relay(request, server_id);
        relay->start();
    } catch (const std::exception& e) {
        spdlog::error("Failed to start stdio proxy for '{}': {}", request.command, e.what());
        return DaemonResponse::failure(std::string("failed to start stdio proxy: ") + e.what());
    }

    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        servers_[server_id] = relay;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shutdown_started_) {
            // shutdown() already collected the registry; this relay is ours to stop
            relay->stop();
            std::unique_lock<std::shared_mutex> registry_lock(registry_mutex_);
            servers_.erase(server_id);
            return DaemonResponse::failure("daemon is shutting down");
        }
        watchers_.spawn([this, server_id, relay] {
            relay->wait();
            std::unique_lock<std::shared_mutex> lock(registry_mutex_);
            servers_.erase(server_id);
            spdlog::info("Relay {} finished", server_id);
        });
    }

    spdlog::info("Started stdio relay {} for '{}'", server_id, request.command);

    DaemonResponse response;
    response.success = true;
    response.server_id = server_id;
    response.data = {{"command", request.command}, {"args", request.args}};
    return response;
}

DaemonResponse Daemon::handle_status(const DaemonRequest&) {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    DaemonResponse response;
    response.success = true;
    response.port = port_;
    response.data = {
        {"running", running_.load()},
        {"port", port_},
        {"server_count", server_count()},
        {"servers", server_ids()},
        {"uptime_seconds", uptime.count()}
    };
    return response;
}

DaemonResponse Daemon::handle_stop(const DaemonRequest&) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!stop_thread_.joinable()) {
            stop_thread_ = std::thread([this] {
                std::this_thread::sleep_for(options_.stop_delay);
                shutdown();
            });
        }
    }

    DaemonResponse response;
    response.success = true;
    response.data = {{"message", "daemon stopping"}};
    return response;
}

} // namespace mcpgate
