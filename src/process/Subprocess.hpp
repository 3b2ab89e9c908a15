#pragma once

#include <sys/types.h>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Raised when a child process cannot be spawned or controlled
 */
class SubprocessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief What to execute and where
 */
struct ProcessSpec {
    std::string command;                        // resolved through PATH
    std::vector<std::string> args;
    std::string working_dir;                    // empty: inherit
    std::map<std::string, std::string> env;     // added on top of the parent environment
};

/**
 * @brief Outcome of a one-shot run
 */
struct ProcessResult {
    int exit_code = -1;        // 128 + signal when killed by a signal
    bool timed_out = false;
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief POSIX child process with piped standard streams
 *
 * Two modes of use:
 * - run(): feed input, collect output, enforce a deadline (kills on expiry)
 * - start(): spawn and hand the pipe descriptors to a streaming consumer
 *
 * The object owns the pipe descriptors and reaps the child. Destroying a
 * running Subprocess terminates it.
 */
class Subprocess {
public:
    explicit Subprocess(ProcessSpec spec);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * @brief Fork and exec the command
     * @throws SubprocessError if pipes cannot be created or exec fails
     * @throws std::logic_error if already started
     */
    void start();

    pid_t pid() const { return pid_; }
    const ProcessSpec& spec() const { return spec_; }

    /// Parent ends of the pipes (-1 once closed)
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    /**
     * @brief Close the write end of the child's stdin, signalling EOF
     */
    void close_stdin();

    /**
     * @brief Check whether the child is still running (reaps it if not)
     */
    bool is_alive();

    /**
     * @brief Poll for exit for up to timeout
     * @return true if the child has exited and been reaped
     */
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Block until the child exits
     * @return Exit code
     */
    int wait();

    /**
     * @brief SIGTERM, then SIGKILL if still running after grace
     */
    void terminate(std::chrono::milliseconds grace);

    /**
     * @brief SIGKILL without grace
     */
    void kill();

    std::optional<int> exit_code() const;

    /**
     * @brief Run a command to completion with input on stdin under a deadline
     *
     * On deadline the child is killed with SIGKILL and reaped; the result is
     * marked timed_out with whatever output had been captured.
     *
     * @throws SubprocessError if the command cannot be spawned
     */
    static ProcessResult run(const ProcessSpec& spec, const std::string& input,
                             std::chrono::milliseconds timeout);

private:
    bool try_reap(int options);
    static void close_fd(int& fd);

    ProcessSpec spec_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    mutable std::mutex state_mutex_;
    std::optional<int> exit_code_;
};

} // namespace mcpgate
