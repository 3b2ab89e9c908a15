#pragma once

#include <optional>
#include <string>

namespace mcpgate {

/**
 * @brief Abstract interface for newline-delimited frame transports
 *
 * Implementations move raw JSON-RPC frames (one per line, without the
 * terminating newline) over some byte stream. Frames are not parsed here.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next frame from transport
     *
     * Blocks until a full line is available, the stream ends or close() is
     * called from another thread.
     *
     * @return Frame text, or std::nullopt on EOF/error/close
     */
    virtual std::optional<std::string> read_frame() = 0;

    /**
     * @brief Write one frame followed by a newline
     * @param frame Frame text without trailing newline
     * @return false if the peer is gone or the transport is closed
     */
    virtual bool write_frame(const std::string& frame) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Close the transport and wake any blocked reader
     */
    virtual void close() = 0;
};

} // namespace mcpgate
