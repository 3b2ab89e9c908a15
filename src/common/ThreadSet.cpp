#include "ThreadSet.hpp"

namespace mcpgate {

ThreadSet::~ThreadSet() {
    join_all();
}

void ThreadSet::join_all() {
    std::map<std::uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(threads_);
    }
    for (auto& [id, thread] : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = finished_.begin(); it != finished_.end();) {
        it = threads.count(*it) ? finished_.erase(it) : it + 1;
    }
}

size_t ThreadSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

void ThreadSet::reap(std::unique_lock<std::mutex>&) {
    // A finished thread has nothing left to do but return; joining is brief
    for (std::uint64_t id : finished_) {
        auto it = threads_.find(id);
        if (it != threads_.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            threads_.erase(it);
        }
    }
    finished_.clear();
}

} // namespace mcpgate
