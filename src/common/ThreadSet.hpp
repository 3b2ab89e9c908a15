#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace mcpgate {

/**
 * @brief Owns worker threads and joins them once they finish
 *
 * Threads that have returned are joined on the next spawn(), so the set
 * only holds threads that are still running. join_all() waits for every
 * thread, including the destruction of whatever its callable captured.
 */
class ThreadSet {
public:
    ThreadSet() = default;
    ~ThreadSet();

    ThreadSet(const ThreadSet&) = delete;
    ThreadSet& operator=(const ThreadSet&) = delete;

    /**
     * @brief Run fn on a new thread
     *
     * fn may be move-only. It must not throw.
     */
    template <typename F>
    void spawn(F&& fn) {
        std::unique_lock<std::mutex> lock(mutex_);
        reap(lock);
        const std::uint64_t id = next_id_++;
        threads_.emplace(id, std::thread([this, id, fn = std::forward<F>(fn)]() mutable {
            fn();
            std::lock_guard<std::mutex> done(mutex_);
            finished_.push_back(id);
        }));
    }

    /// Join every thread; later spawn() calls start a new generation
    void join_all();

    /// Threads not yet joined
    size_t size() const;

private:
    void reap(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    std::uint64_t next_id_ = 0;
    std::map<std::uint64_t, std::thread> threads_;
    std::vector<std::uint64_t> finished_;
};

} // namespace mcpgate
