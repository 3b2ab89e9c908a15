#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace mcpgate {

/**
 * @brief Transport over a pair of file descriptors
 *
 * Reads lines from read_fd and writes lines to write_fd. Either descriptor
 * may be -1 for a one-way transport. Blocking reads poll the data
 * descriptor together with an internal wake pipe so close() from another
 * thread interrupts them. Writes are serialized.
 *
 * Used for the relay's own stdin/stdout and for a child's pipes.
 */
class PipeTransport : public ITransport {
public:
    /**
     * @brief Construct pipe transport
     * @param read_fd Descriptor frames are read from (-1: none)
     * @param write_fd Descriptor frames are written to (-1: none)
     * @param owns_fds Close the descriptors in close()/destructor
     * @throws std::runtime_error if the wake pipe cannot be created
     */
    PipeTransport(int read_fd, int write_fd, bool owns_fds = false);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    std::optional<std::string> read_frame() override;
    bool write_frame(const std::string& frame) override;
    bool is_open() const override;
    void close() override;

private:
    bool fill_buffer();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    int wake_fds_[2] = {-1, -1};

    std::string buffer_;
    std::atomic<bool> eof_{false};
    std::atomic<bool> open_{true};
    std::mutex write_mutex_;
};

} // namespace mcpgate
