#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

using TimerId = uint64_t;
constexpr TimerId kNoTimer = 0;

class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual TimerId After(std::chrono::milliseconds delay, std::function<void()> task) = 0;
    // Cancelling a timer that already fired, or kNoTimer, is a no-op.
    virtual void Cancel(TimerId id) = 0;
};

// Runs every task on one background thread.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TimerId After(std::chrono::milliseconds delay, std::function<void()> task) override;
    void Cancel(TimerId id) override;

private:
    struct Entry {
        std::chrono::steady_clock::time_point deadline;
        std::function<void()> task;
    };

    void Run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerId, Entry> timers_;
    TimerId next_id_ = 1;
    std::atomic<bool> active_{ true };
    std::thread thread_;
};
