#pragma once

#include "logging/EventLogger.hpp"
#include <mutex>
#include <vector>

namespace mcpgate {

/**
 * @brief Keeps every logged event in memory
 */
class RecordingEventLogger : public IEventLogger {
public:
    void log_event(const McpEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<McpEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<McpEvent> events_;
};

} // namespace mcpgate
