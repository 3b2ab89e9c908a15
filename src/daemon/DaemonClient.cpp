#include "DaemonClient.hpp"
#include "common/Util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

tcp::endpoint loopback(unsigned short port) {
    return tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), port);
}

} // namespace

DaemonClient::DaemonClient(unsigned short port, std::chrono::milliseconds timeout)
    : port_(port), timeout_(timeout) {
}

DaemonResponse DaemonClient::send_request(const DaemonRequest& request) const {
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    stream.expires_after(timeout_);
    stream.async_connect(loopback(port_), [&ec](beast::error_code e) { ec = e; });
    ioc.run();
    if (ec) {
        throw DaemonClientError("failed to connect to daemon on port " + std::to_string(port_) +
                                ": " + ec.message());
    }

    const std::string out = json(request).dump() + "\n";
    ioc.restart();
    asio::async_write(stream, asio::buffer(out), [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) {
        throw DaemonClientError("failed to send request: " + ec.message());
    }

    std::string line;
    ioc.restart();
    asio::async_read_until(stream, asio::dynamic_buffer(line), '\n',
                           [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (ec == beast::error::timeout) {
        throw DaemonClientError("timed out waiting for daemon response");
    }
    if (ec && ec != asio::error::eof) {
        throw DaemonClientError("failed to read response: " + ec.message());
    }

    auto newline = line.find('\n');
    if (newline != std::string::npos) {
        line.erase(newline);
    }
    if (line.empty()) {
        throw DaemonClientError("daemon closed the connection without a response");
    }

    try {
        return parse_response(line);
    } catch (const std::invalid_argument& e) {
        throw DaemonClientError(e.what());
    }
}

DaemonResponse DaemonClient::start_stdio(const std::string& command,
                                         const std::vector<std::string>& args,
                                         const std::string& config_path) const {
    DaemonRequest request;
    request.type = request_type::kStdio;
    request.command = command;
    request.args = args;
    request.id = "stdio_" + std::to_string(unix_nanos());
    if (!config_path.empty()) {
        request.metadata["config"] = config_path;
    }
    return send_request(request);
}

DaemonResponse DaemonClient::status() const {
    DaemonRequest request;
    request.type = request_type::kStatus;
    request.id = "status_" + std::to_string(unix_nanos());
    return send_request(request);
}

DaemonResponse DaemonClient::stop() const {
    DaemonRequest request;
    request.type = request_type::kStop;
    request.id = "stop_" + std::to_string(unix_nanos());
    return send_request(request);
}

bool DaemonClient::is_daemon_running(unsigned short port) {
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    stream.expires_after(std::chrono::seconds(1));
    stream.async_connect(loopback(port), [&ec](beast::error_code e) { ec = e; });
    ioc.run();

    if (!ec) {
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        return true;
    }
    spdlog::debug("No daemon on port {}: {}", port, ec.message());
    return false;
}

} // namespace mcpgate
