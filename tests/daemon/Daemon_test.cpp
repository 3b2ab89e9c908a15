#include <gtest/gtest.h>
#include "daemon/Daemon.hpp"
#include "daemon/DaemonClient.hpp"
#include "helpers/MockTransport.hpp"

#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace mcpgate;
using namespace std::chrono_literals;

namespace {

/// Port that was free a moment ago
unsigned short free_port() {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(
        ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

/// Send one raw line on the control port and return the reply line
std::string exchange(unsigned short port, const std::string& line) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket socket(ioc);
    socket.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    boost::asio::write(socket, boost::asio::buffer(line));

    std::string reply;
    boost::system::error_code ec;
    boost::asio::read_until(socket, boost::asio::dynamic_buffer(reply), '\n', ec);
    return reply;
}

} // namespace

class DaemonTest : public ::testing::Test {
protected:
    unsigned short port_ = free_port();
    std::shared_ptr<MockTransport> relay_client_ = std::make_shared<MockTransport>();

    DaemonOptions options() {
        DaemonOptions opts;
        opts.port = port_;
        opts.stop_delay = 20ms;
        opts.relay_factory = [this](const DaemonRequest& request, const std::string& server_id) {
            StdioRelayOptions relay_options;
            relay_options.command = request.command;
            relay_options.args = request.args;
            relay_options.server_id = server_id;
            relay_options.stop_grace = 1000ms;
            return std::make_shared<StdioRelay>(relay_options, relay_client_);
        };
        return opts;
    }
};

TEST_F(DaemonTest, StatusOverControlPort) {
    Daemon daemon(options());
    daemon.start();
    ASSERT_TRUE(daemon.is_running());
    EXPECT_EQ(daemon.port(), port_);

    EXPECT_TRUE(DaemonClient::is_daemon_running(port_));

    DaemonResponse status = DaemonClient(port_, 5s).status();
    EXPECT_TRUE(status.success);
    EXPECT_EQ(status.port, port_);
    EXPECT_TRUE(status.data["running"].get<bool>());
    EXPECT_EQ(status.data["server_count"], 0);
    EXPECT_GE(status.data["uptime_seconds"].get<int>(), 0);
}

TEST_F(DaemonTest, SecondDaemonOnSamePortIsRejected) {
    Daemon first(options());
    first.start();

    Daemon second(options());
    EXPECT_THROW(second.start(), DaemonAlreadyRunningError);
    EXPECT_TRUE(first.is_running());
}

TEST_F(DaemonTest, ConcurrentStartsHaveOneWinner) {
    constexpr int kAttempts = 8;
    std::vector<std::unique_ptr<Daemon>> daemons;
    for (int i = 0; i < kAttempts; ++i) {
        daemons.push_back(std::make_unique<Daemon>(options()));
    }

    std::atomic<int> started{0};
    std::atomic<int> rejected{0};
    std::atomic<int> other_errors{0};
    std::vector<std::thread> threads;
    for (auto& daemon : daemons) {
        threads.emplace_back([&daemon, &started, &rejected, &other_errors] {
            try {
                daemon->start();
                ++started;
            } catch (const DaemonAlreadyRunningError&) {
                ++rejected;
            } catch (const std::exception&) {
                ++other_errors;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(rejected.load(), kAttempts - 1);
    EXPECT_EQ(other_errors.load(), 0);
}

TEST_F(DaemonTest, StartsStdioRelay) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = DaemonClient(port_, 5s).start_stdio(FAKE_TOOL_SERVER_PATH, {});
    ASSERT_TRUE(response.success) << response.error;
    EXPECT_EQ(response.server_id.rfind(std::string("stdio_") + FAKE_TOOL_SERVER_PATH, 0), 0);
    EXPECT_EQ(response.data["command"], FAKE_TOOL_SERVER_PATH);
    EXPECT_EQ(daemon.server_count(), 1);
    EXPECT_EQ(daemon.server_ids(), std::vector<std::string>{response.server_id});

    relay_client_->push_frame(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    ASSERT_TRUE(relay_client_->wait_for_written(1));
    EXPECT_EQ(json::parse(relay_client_->written()[0])["id"], 1);
}

TEST_F(DaemonTest, FinishedRelayLeavesRegistry) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = DaemonClient(port_, 5s).start_stdio(FAKE_TOOL_SERVER_PATH, {"--exit-after", "0"});
    ASSERT_TRUE(response.success) << response.error;

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (daemon.server_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_EQ(daemon.server_count(), 0);
}

TEST_F(DaemonTest, StdioWithoutCommandFails) {
    Daemon daemon(options());
    daemon.start();

    DaemonRequest request;
    request.type = request_type::kStdio;
    DaemonResponse response = DaemonClient(port_, 5s).send_request(request);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "command is required");
}

TEST_F(DaemonTest, SpawnFailureIsReported) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = DaemonClient(port_, 5s).start_stdio("/nonexistent/tool-server", {});
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error.find("failed to start stdio proxy"), std::string::npos) << response.error;
    EXPECT_EQ(daemon.server_count(), 0);
}

TEST_F(DaemonTest, UnknownTypeIsReported) {
    Daemon daemon(options());

    DaemonRequest request;
    request.type = "bogus";
    DaemonResponse response = daemon.handle_request(request);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "unknown request type: bogus");
}

TEST_F(DaemonTest, MalformedRequestGetsFailureReply) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = parse_response(exchange(port_, "this is not json\n"));
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error.find("failed to decode request"), std::string::npos);
}

TEST_F(DaemonTest, RequestWithoutNewlineIsAccepted) {
    Daemon daemon(options());
    daemon.start();

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket socket(ioc);
    socket.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port_));
    boost::asio::write(socket, boost::asio::buffer(std::string(R"({"type":"status","id":"s1"})")));
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send);

    std::string reply;
    boost::system::error_code ec;
    boost::asio::read_until(socket, boost::asio::dynamic_buffer(reply), '\n', ec);
    EXPECT_TRUE(parse_response(reply).success);
}

TEST_F(DaemonTest, StopRequestShutsDown) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = DaemonClient(port_, 5s).stop();
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.data["message"], "daemon stopping");

    ASSERT_TRUE(daemon.wait_for(5s));
    EXPECT_FALSE(daemon.is_running());
    EXPECT_FALSE(DaemonClient::is_daemon_running(port_));
}

TEST_F(DaemonTest, ShutdownStopsRelays) {
    Daemon daemon(options());
    daemon.start();

    DaemonResponse response = DaemonClient(port_, 5s).start_stdio(FAKE_TOOL_SERVER_PATH, {});
    ASSERT_TRUE(response.success) << response.error;

    daemon.shutdown();
    EXPECT_EQ(daemon.server_count(), 0);
    EXPECT_FALSE(relay_client_->is_open());

    daemon.shutdown();
    EXPECT_TRUE(daemon.wait_for(10ms));
}

TEST_F(DaemonTest, ShutdownRightAfterManyConnections) {
    for (int round = 0; round < 5; ++round) {
        auto daemon = std::make_unique<Daemon>(options());
        daemon->start();
        for (int i = 0; i < 10; ++i) {
            EXPECT_TRUE(DaemonClient(port_, 5s).status().success);
        }
        daemon.reset();
    }
}

TEST_F(DaemonTest, PortIsReusableAfterShutdown) {
    {
        Daemon daemon(options());
        daemon.start();
        EXPECT_TRUE(DaemonClient(port_, 5s).status().success);
    }
    Daemon again(options());
    EXPECT_NO_THROW(again.start());
}

TEST(DaemonClientTest, NoDaemonIsClientError) {
    unsigned short port = free_port();
    EXPECT_FALSE(DaemonClient::is_daemon_running(port));
    EXPECT_THROW(DaemonClient(port, 1s).status(), DaemonClientError);
}
