#include "PipeTransport.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcpgate {

PipeTransport::PipeTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
    if (pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::runtime_error(std::string("Failed to create wake pipe: ") + std::strerror(errno));
    }
    spdlog::debug("PipeTransport initialized (read_fd={}, write_fd={})", read_fd_, write_fd_);
}

PipeTransport::~PipeTransport() {
    close();
    if (owns_fds_) {
        if (read_fd_ >= 0) {
            ::close(read_fd_);
        }
        if (write_fd_ >= 0 && write_fd_ != read_fd_) {
            ::close(write_fd_);
        }
    }
    ::close(wake_fds_[0]);
    ::close(wake_fds_[1]);
}

bool PipeTransport::fill_buffer() {
    pollfd fds[2] = {
        {read_fd_, POLLIN, 0},
        {wake_fds_[0], POLLIN, 0}
    };

    while (open_) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() on fd {} failed: {}", read_fd_, std::strerror(errno));
            eof_ = true;
            return false;
        }

        if (fds[1].revents) {
            return false;  // woken by close()
        }
        if (fds[0].revents == 0) {
            continue;
        }

        char chunk[8192];
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (n < 0) {
            spdlog::debug("read() on fd {} failed: {}", read_fd_, std::strerror(errno));
        } else {
            spdlog::debug("Reached end of input on fd {}", read_fd_);
        }
        eof_ = true;
        return false;
    }
    return false;
}

std::optional<std::string> PipeTransport::read_frame() {
    if (read_fd_ < 0) {
        return std::nullopt;
    }

    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        if (!open_) {
            return std::nullopt;
        }

        if (eof_ || !fill_buffer()) {
            // A final unterminated line still counts as a frame
            if (eof_ && !buffer_.empty()) {
                std::string line;
                line.swap(buffer_);
                return line;
            }
            return std::nullopt;
        }
    }
}

bool PipeTransport::write_frame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!open_ || write_fd_ < 0) {
        return false;
    }

    std::string data = frame;
    data.push_back('\n');

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(write_fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("write() on fd {} failed: {}", write_fd_, std::strerror(errno));
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

bool PipeTransport::is_open() const {
    return open_ && !eof_;
}

void PipeTransport::close() {
    bool expected = true;
    if (open_.compare_exchange_strong(expected, false)) {
        char byte = 1;
        ssize_t ignored = ::write(wake_fds_[1], &byte, 1);
        (void)ignored;
    }
}

} // namespace mcpgate
