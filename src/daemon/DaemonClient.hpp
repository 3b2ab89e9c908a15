#pragma once

#include "DaemonProtocol.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Daemon unreachable, timed out or sent an unreadable reply
 */
class DaemonClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Talks to a running daemon over its loopback control port
 *
 * Each call opens a fresh connection, sends one request line and reads one
 * response line.
 */
class DaemonClient {
public:
    explicit DaemonClient(unsigned short port = kDaemonPort,
                          std::chrono::milliseconds timeout = std::chrono::seconds(30));

    /**
     * @brief Send a request and return the daemon's response
     * @throws DaemonClientError on connection, timeout or decode failure
     */
    DaemonResponse send_request(const DaemonRequest& request) const;

    /**
     * @brief Ask the daemon to start a stdio relay
     * @param config_path Configuration file for the relay's processors (optional)
     */
    DaemonResponse start_stdio(const std::string& command,
                               const std::vector<std::string>& args,
                               const std::string& config_path = "") const;

    DaemonResponse status() const;
    DaemonResponse stop() const;

    /**
     * @brief True if something accepts connections on the port
     */
    static bool is_daemon_running(unsigned short port = kDaemonPort);

private:
    unsigned short port_;
    std::chrono::milliseconds timeout_;
};

} // namespace mcpgate
