#pragma once

#include "MessageProcessor.hpp"
#include "process/Subprocess.hpp"
#include "transport/ITransport.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {

/**
 * @brief Settings for one stdio relay
 */
struct StdioRelayOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    std::vector<ProcessorConfig> processors;
    std::string server_name;       // reported to processors (default: command)
    std::string server_id;         // recorded in events (default: generated)

    std::shared_ptr<IEventLogger> event_logger;
    std::chrono::milliseconds stop_grace{5000};   // SIGTERM -> SIGKILL
};

/**
 * @brief Relay between a client transport and one child tool server
 *
 * Owns the child process. Two forwarding loops run the processor chain on
 * every frame, one per direction, and a third thread copies the child's
 * stderr into the diagnostic log. A supervisor thread waits for a shutdown
 * request, stops both loops, terminates the child and marks the relay
 * stopped.
 *
 * Shutdown triggers: child stdout EOF, I/O errors, stop(). Client EOF
 * closes the child's stdin and lets the child finish responding (bounded by
 * the stop grace period) before shutting down.
 */
class StdioRelay {
public:
    enum class State {
        Created,
        Started,
        Stopping,
        Stopped
    };

    /**
     * @brief Construct relay (does not spawn)
     * @param options Command, processors and timing
     * @param client Transport toward the client
     * @throws std::invalid_argument if command is empty or client is null
     */
    StdioRelay(StdioRelayOptions options, std::shared_ptr<ITransport> client);
    ~StdioRelay();

    StdioRelay(const StdioRelay&) = delete;
    StdioRelay& operator=(const StdioRelay&) = delete;

    /**
     * @brief Spawn the child and start relaying
     * @throws std::logic_error if already started
     * @throws SubprocessError if the child cannot be spawned
     */
    void start();

    /**
     * @brief Stop relaying and terminate the child; blocks until stopped
     *
     * No-op if never started or already stopped.
     */
    void stop();

    /**
     * @brief Block until the relay reaches Stopped (returns at once if never started)
     */
    void wait();

    /**
     * @brief Wait up to timeout for Stopped
     * @return true if stopped (or never started)
     */
    bool wait_for(std::chrono::milliseconds timeout);

    State state() const;
    std::optional<int> exit_code() const;
    pid_t pid() const;

    const std::string& session_id() const { return session_id_; }
    const std::string& server_id() const { return server_id_; }
    const StdioRelayOptions& options() const { return options_; }

private:
    void client_to_server_loop();
    void server_to_client_loop();
    void stderr_loop();
    void supervise();

    void request_shutdown(bool drain);
    bool write_to_client(const std::string& frame);
    Message make_message(Direction direction, std::string raw) const;
    McpEvent make_event() const;
    void log_system_event(const std::string& text);

    StdioRelayOptions options_;
    std::shared_ptr<ITransport> client_;
    std::string session_id_;
    std::string server_id_;
    std::shared_ptr<const Chain> chain_;
    MessageProcessor processor_;

    std::unique_ptr<Subprocess> process_;
    std::unique_ptr<ITransport> server_in_;
    std::unique_ptr<ITransport> server_out_;
    std::unique_ptr<ITransport> server_err_;

    std::thread client_thread_;
    std::thread server_thread_;
    std::thread stderr_thread_;
    std::thread supervisor_thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Created;
    bool shutdown_requested_ = false;
    bool drain_ = false;
    bool server_done_ = false;
    bool stderr_done_ = false;

    std::mutex client_write_mutex_;
};

std::string_view to_string(StdioRelay::State state);

} // namespace mcpgate
