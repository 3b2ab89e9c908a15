#pragma once

#include "MessageProcessor.hpp"
#include "common/ThreadSet.hpp"
#include "config/Config.hpp"
#include "logging/EventLogger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/// Largest request or response body relayed, in bytes
constexpr std::uint64_t kMaxBodySize = 10 * 1024 * 1024;

/**
 * @brief Parsed http:// downstream address
 */
struct DownstreamUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";

    /**
     * @brief Parse an http:// URL
     * @throws ConfigError for other schemes or a missing host
     */
    static DownstreamUrl parse(const std::string& url);
};

/**
 * @brief One exposed (gateway, server) pair
 */
struct HttpEndpoint {
    std::string path;              // /mcp/<gateway>/<server>
    std::string gateway;
    std::string server_name;
    ServerConfig server;
    DownstreamUrl downstream;
    std::shared_ptr<MessageProcessor> processor;
};

/**
 * @brief HTTP front for downstream HTTP tool servers
 *
 * Serves one endpoint per enabled (gateway, server) pair and forwards each
 * request to the server's URL with its configured headers. Request and
 * response bodies pass through the endpoint's processor chain (global
 * processors followed by the gateway's). A rejected request is answered
 * with the JSON-RPC error envelope and never forwarded.
 *
 * Accepting runs on an io_context thread; each connection is served
 * synchronously on its own thread.
 */
class HttpRelay {
public:
    /**
     * @brief Build endpoints from configuration
     * @param config Validated configuration with at least one gateway
     * @param event_logger Activity sink (may be null)
     * @throws ConfigError if no usable endpoint can be built
     */
    HttpRelay(GlobalConfig config, std::shared_ptr<IEventLogger> event_logger = nullptr);
    ~HttpRelay();

    HttpRelay(const HttpRelay&) = delete;
    HttpRelay& operator=(const HttpRelay&) = delete;

    /**
     * @brief Bind and start accepting in the background
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * @brief start() and block until stop()
     */
    void run();

    /**
     * @brief Stop accepting, abort open connections and wait for them
     */
    void stop();

    /**
     * @brief Block until stop() has completed
     */
    void wait();

    bool wait_for(std::chrono::milliseconds timeout);

    /// Bound port (valid after start())
    unsigned short port() const { return port_; }

    std::vector<std::string> endpoint_paths() const;

private:
    void do_accept();
    void handle_connection(tcp::socket socket);
    http::response<http::string_body> handle_request(const http::request<http::string_body>& req);
    http::response<http::string_body> forward(const HttpEndpoint& endpoint,
                                              const http::request<http::string_body>& req,
                                              const std::string& body,
                                              McpEvent event);
    std::string process_response_body(const HttpEndpoint& endpoint,
                                      const std::string& body,
                                      bool event_stream,
                                      const McpEvent& event);
    McpEvent make_event(const HttpEndpoint& endpoint) const;

    GlobalConfig config_;
    std::shared_ptr<IEventLogger> event_logger_;
    std::map<std::string, HttpEndpoint> endpoints_;
    std::string session_id_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread accept_thread_;
    unsigned short port_ = 0;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::set<int> open_sockets_;
    bool started_ = false;
    bool finished_ = false;

    ThreadSet connections_;
};

} // namespace mcpgate
