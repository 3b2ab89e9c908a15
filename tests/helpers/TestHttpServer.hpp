#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {

/**
 * @brief Local HTTP stub standing in for a downstream tool server
 *
 * Serves one request per connection on 127.0.0.1 with an ephemeral port.
 * Every request is recorded; the handler decides the response.
 */
class TestHttpServer {
public:
    struct Request {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers;   // lower-cased names
        std::string body;
    };

    struct Response {
        unsigned status = 200;
        std::string content_type = "application/json";
        std::string body;
        std::chrono::milliseconds delay{0};
    };

    using Handler = std::function<Response(const Request&)>;

    explicit TestHttpServer(Handler handler);
    ~TestHttpServer();

    void stop();

    unsigned short port() const { return port_; }
    std::string url(const std::string& path = "/mcp") const;

    std::vector<Request> requests() const;

private:
    void do_accept();
    void serve(boost::asio::ip::tcp::socket& socket);

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::vector<Request> requests_;
};

} // namespace mcpgate
