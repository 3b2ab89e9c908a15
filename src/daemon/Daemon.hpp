#pragma once

#include "DaemonProtocol.hpp"
#include "common/ThreadSet.hpp"
#include "config/Config.hpp"
#include "logging/EventLogger.hpp"
#include "relay/StdioRelay.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {

/**
 * @brief Another daemon already holds the control port
 */
class DaemonAlreadyRunningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Builds a not yet started relay for a start-stdio request
 */
using RelayFactory = std::function<std::shared_ptr<StdioRelay>(const DaemonRequest& request,
                                                               const std::string& server_id)>;

struct DaemonOptions {
    unsigned short port = kDaemonPort;
    std::string bind_address = "127.0.0.1";
    std::optional<GlobalConfig> config;          // processors for started relays
    std::shared_ptr<IEventLogger> event_logger;
    RelayFactory relay_factory;                  // empty: relay on the daemon's stdin/stdout
    std::chrono::milliseconds stop_delay{100};   // between stop reply and shutdown
};

/**
 * @brief Background host for many stdio relays
 *
 * Binding the control port is the single-instance guarantee: a second
 * daemon fails to bind and reports DaemonAlreadyRunningError. Each control
 * connection carries one request line and gets one response line.
 *
 * Started relays are kept in a registry keyed by server id and removed by
 * a watcher thread once their child exits.
 */
class Daemon {
public:
    explicit Daemon(DaemonOptions options = DaemonOptions());
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /**
     * @brief Bind the control port and start accepting
     * @throws DaemonAlreadyRunningError if the port is taken
     * @throws std::runtime_error for other socket failures
     */
    void start();

    /**
     * @brief Close the listener, stop all relays, wait for connections
     *
     * Idempotent and safe to call from several threads.
     */
    void shutdown();

    /**
     * @brief Block until shutdown has completed (returns at once if never started)
     */
    void wait();
    bool wait_for(std::chrono::milliseconds timeout);

    /**
     * @brief Dispatch one control request
     */
    DaemonResponse handle_request(const DaemonRequest& request);

    bool is_running() const { return running_; }
    unsigned short port() const { return port_; }
    size_t server_count() const;
    std::vector<std::string> server_ids() const;

private:
    void do_accept();
    void handle_connection(boost::asio::ip::tcp::socket socket);

    DaemonResponse handle_stdio(const DaemonRequest& request);
    DaemonResponse handle_status(const DaemonRequest& request);
    DaemonResponse handle_stop(const DaemonRequest& request);

    std::shared_ptr<StdioRelay> make_default_relay(const DaemonRequest& request,
                                                   const std::string& server_id);

    DaemonOptions options_;
    unsigned short port_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::chrono::steady_clock::time_point started_at_;

    std::atomic<bool> running_{false};

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<StdioRelay>> servers_;

    std::mutex state_mutex_;
    std::condition_variable cv_;
    std::thread stop_thread_;
    std::set<int> open_sockets_;
    bool started_ = false;
    bool shutdown_started_ = false;
    bool finished_ = false;

    // Before ioc_ goes away, both sets are joined
    ThreadSet watchers_;
    ThreadSet connections_;
};

} // namespace mcpgate
