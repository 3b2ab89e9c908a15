#include "TestHttpServer.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>

namespace mcpgate {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

std::string lower(beast::string_view text) {
    std::string result(text.data(), text.size());
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

TestHttpServer::TestHttpServer(Handler handler)
    : handler_(std::move(handler)),
      acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    do_accept();
    thread_ = std::thread([this] { ioc_.run(); });
}

TestHttpServer::~TestHttpServer() {
    stop();
}

void TestHttpServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    boost::asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string TestHttpServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::vector<TestHttpServer::Request> TestHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

void TestHttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            return;
        }
        serve(socket);
        if (!stopping_) {
            do_accept();
        }
    });
}

void TestHttpServer::serve(tcp::socket& socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;
    http::read(socket, buffer, req, ec);
    if (ec) {
        return;
    }

    Request recorded;
    recorded.method = std::string(req.method_string().data(), req.method_string().size());
    recorded.target = std::string(req.target().data(), req.target().size());
    for (const auto& field : req) {
        recorded.headers[lower(field.name_string())] =
            std::string(field.value().data(), field.value().size());
    }
    recorded.body = req.body();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(recorded);
    }

    Response response = handler_(recorded);

    // Sleep in slices so stop() is not held up by a long delay
    auto remaining = response.delay;
    while (remaining.count() > 0 && !stopping_) {
        auto slice = std::min(remaining, std::chrono::milliseconds(20));
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }

    http::response<http::string_body> res{static_cast<http::status>(response.status), req.version()};
    res.set(http::field::content_type, response.content_type);
    res.keep_alive(false);
    res.body() = response.body;
    res.prepare_payload();
    http::write(socket, res, ec);

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace mcpgate
