#include "scheduler.hpp"

ThreadScheduler::ThreadScheduler() {
    thread_ = std::thread([this]() { Run(); });
}

ThreadScheduler::~ThreadScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        timers_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

TimerId ThreadScheduler::After(std::chrono::milliseconds delay, std::function<void()> task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = Entry{ std::chrono::steady_clock::now() + delay, std::move(task) };
    }
    cv_.notify_all();
    return id;
}

void ThreadScheduler::Cancel(TimerId id) {
    if (id == kNoTimer) return;
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void ThreadScheduler::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (active_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.deadline < next->second.deadline) next = it;
        }

        auto now = std::chrono::steady_clock::now();
        if (next->second.deadline > now) {
            cv_.wait_until(lock, next->second.deadline);
            continue;
        }

        auto task = std::move(next->second.task);
        timers_.erase(next);
        lock.unlock();
        task();
        lock.lock();
    }
}
