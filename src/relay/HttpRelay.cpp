#include "HttpRelay.hpp"
#include "common/Util.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sstream>

namespace mcpgate {

namespace {

// Never copied between client and downstream
const char* const kHopByHopHeaders[] = {
    "Host",
    "Connection",
    "Content-Length",
    "Transfer-Encoding",
    "Keep-Alive",
    "Proxy-Connection",
    "TE",
    "Trailer",
    "Upgrade",
    "Accept-Encoding"
};

bool is_hop_by_hop(beast::string_view name) {
    for (const char* header : kHopByHopHeaders) {
        if (beast::iequals(name, header)) {
            return true;
        }
    }
    return false;
}

http::response<http::string_body> json_response(unsigned status, std::string body, unsigned version) {
    http::response<http::string_body> res;
    res.version(version);
    res.result(status);
    res.set(http::field::server, "mcpgate");
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> error_response(unsigned status, const std::string& message, unsigned version) {
    return json_response(status, json{{"error", message}}.dump(-1, ' ', false, json::error_handler_t::replace), version);
}

std::string to_std(beast::string_view view) {
    return std::string(view.data(), view.size());
}

std::string strip_query(beast::string_view target) {
    std::string path = to_std(target);
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    return path;
}

} // namespace

DownstreamUrl DownstreamUrl::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.rfind("https://", 0) == 0) {
        throw ConfigError("https downstream '" + url + "' is not supported");
    }
    if (url.rfind(scheme, 0) != 0) {
        throw ConfigError("downstream URL '" + url + "' must start with http://");
    }

    DownstreamUrl result;
    std::string rest = url.substr(scheme.size());

    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        result.target = rest.substr(path_start);
        if (result.target.front() == '?') {
            result.target.insert(0, "/");
        }
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        result.port = authority.substr(colon + 1);
        authority.erase(colon);
    }
    result.host = authority;

    if (result.host.empty()) {
        throw ConfigError("downstream URL '" + url + "' has no host");
    }
    if (result.port.empty()) {
        result.port = "80";
    }
    return result;
}

HttpRelay::HttpRelay(GlobalConfig config, std::shared_ptr<IEventLogger> event_logger)
    : config_(std::move(config)),
      event_logger_(std::move(event_logger)),
      session_id_("session_" + std::to_string(unix_nanos())),
      acceptor_(ioc_) {
    validate_for_server(config_);

    for (const auto& [gateway_name, gateway] : config_.gateways) {
        for (const auto& [server_name, server] : gateway.servers) {
            if (!server.enabled) {
                spdlog::info("Server '{}/{}' is disabled, no endpoint", gateway_name, server_name);
                continue;
            }
            if (!server.is_http()) {
                spdlog::warn("Server '{}/{}' uses stdio transport, not exposed over HTTP",
                             gateway_name, server_name);
                continue;
            }

            HttpEndpoint endpoint;
            endpoint.path = "/mcp/" + gateway_name + "/" + server_name;
            endpoint.gateway = gateway_name;
            endpoint.server_name = server_name;
            endpoint.server = server;
            endpoint.downstream = DownstreamUrl::parse(server.url);

            auto chain = std::make_shared<Chain>(config_.processors_for(gateway_name),
                                                 server_name, session_id_, Transport::Http);
            endpoint.processor = std::make_shared<MessageProcessor>(chain, event_logger_);

            endpoints_.emplace(endpoint.path, std::move(endpoint));
        }
    }

    if (endpoints_.empty()) {
        throw ConfigError("no enabled HTTP servers configured");
    }
}

HttpRelay::~HttpRelay() {
    stop();
}

std::vector<std::string> HttpRelay::endpoint_paths() const {
    std::vector<std::string> paths;
    for (const auto& [path, endpoint] : endpoints_) {
        paths.push_back(path);
    }
    return paths;
}

void HttpRelay::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw std::logic_error("HTTP relay already started");
    }

    const ProxySettings& proxy = config_.proxy_settings();
    int port;
    try {
        port = std::stoi(proxy.port);
    } catch (const std::exception&) {
        throw ConfigError("invalid proxy port '" + proxy.port + "'");
    }
    if (port < 0 || port > 65535) {
        throw ConfigError("invalid proxy port '" + proxy.port + "'");
    }

    beast::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address(proxy.host, ec), static_cast<unsigned short>(port)};
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + proxy.host + "': " + ec.message());
    }
    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        throw std::runtime_error("acceptor open failed: " + ec.message());
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        throw std::runtime_error("bind to " + proxy.host + ":" + proxy.port + " failed: " + ec.message());
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("listen failed: " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();

    running_ = true;
    started_ = true;
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });

    spdlog::info("HTTP relay listening on {}:{}", proxy.host, port_);
    for (const auto& [path, endpoint] : endpoints_) {
        spdlog::info("  {} -> {}", path, endpoint.server.url);
    }
}

void HttpRelay::run() {
    start();
    wait();
}

void HttpRelay::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !started_ || finished_; });
        return;
    }

    spdlog::info("HTTP relay stopping");
    boost::asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int fd : open_sockets_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    connections_.join_all();

    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    cv_.notify_all();
    spdlog::info("HTTP relay stopped");
}

void HttpRelay::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !started_ || finished_; });
}

bool HttpRelay::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !started_ || finished_; });
}

void HttpRelay::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted && acceptor_.is_open()) {
                spdlog::warn("accept error: {}", ec.message());
                do_accept();
            }
            return;
        }
        if (!running_) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_sockets_.insert(socket.native_handle());
        }
        connections_.spawn([this, socket = std::move(socket)]() mutable {
            handle_connection(std::move(socket));
        });
        do_accept();
    });
}

void HttpRelay::handle_connection(tcp::socket socket) {
    const int fd = socket.native_handle();
    beast::flat_buffer buffer;
    beast::error_code ec;

    while (running_) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxBodySize);
        http::read(socket, buffer, parser, ec);

        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            auto res = error_response(413, "request body exceeds 10 MiB", 11);
            res.keep_alive(false);
            http::write(socket, res, ec);
            break;
        }
        if (ec) {
            spdlog::debug("http read error: {}", ec.message());
            break;
        }

        http::request<http::string_body> req = parser.release();
        http::response<http::string_body> res;
        try {
            res = handle_request(req);
        } catch (const std::exception& e) {
            spdlog::error("Error handling {} {}: {}", to_std(req.method_string()),
                          to_std(req.target()), e.what());
            res = error_response(500, std::string("internal error: ") + e.what(), req.version());
        }

        res.keep_alive(req.keep_alive() && running_);
        res.prepare_payload();
        http::write(socket, res, ec);
        if (ec || !res.keep_alive()) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_sockets_.erase(fd);
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
    socket.close(ec);
}

McpEvent HttpRelay::make_event(const HttpEndpoint& endpoint) const {
    McpEvent event;
    event.server_id = "http_" + endpoint.gateway + "_" + endpoint.server_name;
    event.transport = Transport::Http;
    event.gateway = endpoint.gateway;
    event.server_name = endpoint.server_name;
    event.endpoint = endpoint.path;
    event.downstream_url = endpoint.server.url;
    return event;
}

http::response<http::string_body> HttpRelay::handle_request(const http::request<http::string_body>& req) {
    const std::string path = strip_query(req.target());
    auto it = endpoints_.find(path);
    if (it == endpoints_.end()) {
        spdlog::debug("No endpoint for {}", path);
        return error_response(404, "no endpoint for " + path, req.version());
    }
    const HttpEndpoint& endpoint = it->second;

    McpEvent event = make_event(endpoint);
    std::string body = req.body();

    if (!body.empty()) {
        Message message;
        message.direction = Direction::ClientToServer;
        message.type = classify_frame(body, Direction::ClientToServer);
        message.raw = body;
        message.transport = Transport::Http;
        message.session_id = session_id_;

        FrameDecision decision = endpoint.processor->process(message, event);
        if (decision.action == FrameAction::Reply) {
            return json_response(static_cast<unsigned>(decision.status), decision.frame, req.version());
        }
        if (decision.action == FrameAction::Drop) {
            // A rejected notification has no id to answer
            http::response<http::string_body> res{http::status::accepted, req.version()};
            res.set(http::field::server, "mcpgate");
            res.prepare_payload();
            return res;
        }
        body = std::move(decision.frame);
    }

    return forward(endpoint, req, body, event);
}

http::response<http::string_body> HttpRelay::forward(const HttpEndpoint& endpoint,
                                                     const http::request<http::string_body>& req,
                                                     const std::string& body,
                                                     McpEvent event) {
    const DownstreamUrl& url = endpoint.downstream;
    const auto timeout = std::chrono::seconds(config_.proxy_settings().timeout);

    http::request<http::string_body> down{req.method(), url.target, 11};
    for (const auto& field : req) {
        if (!is_hop_by_hop(field.name_string())) {
            down.insert(field.name_string(), field.value());
        }
    }
    down.set(http::field::host, url.port == "80" ? url.host : url.host + ":" + url.port);
    for (const auto& [key, value] : endpoint.server.substituted_headers()) {
        down.set(key, value);
    }
    down.keep_alive(false);
    down.body() = body;
    down.prepare_payload();

    // Private io_context so the deadline applies to every step
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        spdlog::warn("Cannot resolve downstream {}: {}", endpoint.server.url, ec.message());
        return error_response(502, "downstream unreachable: " + ec.message(), req.version());
    }

    stream.expires_after(timeout);
    stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    ioc.run();
    if (ec) {
        spdlog::warn("Cannot connect to downstream {}: {}", endpoint.server.url, ec.message());
        return error_response(502, "downstream unreachable: " + ec.message(), req.version());
    }

    ioc.restart();
    http::async_write(stream, down, [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) {
        return error_response(502, "failed to send request downstream: " + ec.message(), req.version());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodySize);

    ioc.restart();
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (ec == beast::error::timeout) {
        return error_response(504, "downstream timed out", req.version());
    }
    if (ec == http::error::body_limit) {
        return error_response(502, "downstream response body exceeds 10 MiB", req.version());
    }
    if (ec) {
        return error_response(502, "failed to read downstream response: " + ec.message(), req.version());
    }

    http::response<http::string_body> down_res = parser.release();

    http::response<http::string_body> res;
    res.version(req.version());
    res.result(down_res.result_int());
    for (const auto& field : down_res) {
        if (!is_hop_by_hop(field.name_string())) {
            res.insert(field.name_string(), field.value());
        }
    }

    bool event_stream = false;
    if (auto content_type = down_res.find(http::field::content_type); content_type != down_res.end()) {
        event_stream = content_type->value().find("text/event-stream") != beast::string_view::npos;
    }

    res.body() = process_response_body(endpoint, down_res.body(), event_stream, event);
    res.prepare_payload();
    return res;
}

std::string HttpRelay::process_response_body(const HttpEndpoint& endpoint,
                                             const std::string& body,
                                             bool event_stream,
                                             const McpEvent& event) {
    if (body.empty()) {
        return body;
    }

    auto process = [&](const std::string& raw) {
        Message message;
        message.direction = Direction::ServerToClient;
        message.type = classify_frame(raw, Direction::ServerToClient);
        message.raw = raw;
        message.transport = Transport::Http;
        message.session_id = session_id_;
        return endpoint.processor->process(message, event);
    };

    if (!event_stream) {
        FrameDecision decision = process(body);
        return decision.action == FrameAction::Drop ? std::string() : decision.frame;
    }

    // Server-sent events: each "data:" line carries one JSON-RPC message
    std::istringstream in(body);
    std::string result;
    std::string line;
    while (std::getline(in, line)) {
        bool carriage_return = !line.empty() && line.back() == '\r';
        if (carriage_return) {
            line.pop_back();
        }

        if (line.rfind("data:", 0) == 0) {
            std::string data = line.substr(5);
            if (!data.empty() && data.front() == ' ') {
                data.erase(0, 1);
            }
            if (!data.empty() && data.front() == '{') {
                FrameDecision decision = process(data);
                if (decision.action == FrameAction::Drop) {
                    continue;
                }
                line = "data: " + decision.frame;
            }
        }

        result += line;
        if (carriage_return) {
            result += '\r';
        }
        result += '\n';
    }

    if (!body.empty() && body.back() != '\n' && !result.empty()) {
        result.pop_back();
        if (!result.empty() && result.back() == '\r') {
            result.pop_back();
        }
    }
    return result;
}

} // namespace mcpgate
