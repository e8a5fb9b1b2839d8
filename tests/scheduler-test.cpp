#include <gtest/gtest.h>

#include "scheduler.hpp"

#include <future>
#include <vector>

TEST(ThreadScheduler, RunsTaskAfterDelay) {
    ThreadScheduler scheduler;
    std::promise<void> fired;
    auto start = std::chrono::steady_clock::now();
    scheduler.After(std::chrono::milliseconds(20), [&]() { fired.set_value(); });

    ASSERT_EQ(fired.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(ThreadScheduler, CancelledTaskNeverRuns) {
    ThreadScheduler scheduler;
    std::atomic<bool> cancelled_ran{ false };
    std::promise<void> later;

    TimerId id = scheduler.After(std::chrono::milliseconds(30), [&]() { cancelled_ran = true; });
    scheduler.After(std::chrono::milliseconds(80), [&]() { later.set_value(); });
    scheduler.Cancel(id);

    ASSERT_EQ(later.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(cancelled_ran);
}

TEST(ThreadScheduler, EarlierDeadlineRunsFirst) {
    ThreadScheduler scheduler;
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    scheduler.After(std::chrono::milliseconds(60), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(2);
        done.set_value();
    });
    scheduler.After(std::chrono::milliseconds(10), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
    });

    ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{ 1, 2 }));
}

TEST(ThreadScheduler, CancelUnknownIdIsHarmless) {
    ThreadScheduler scheduler;
    scheduler.Cancel(kNoTimer);
    scheduler.Cancel(12345);
}
