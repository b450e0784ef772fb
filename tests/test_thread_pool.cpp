//
// Created by Giuseppe Francione on 26/01/26.
//

#include <gtest/gtest.h>
#include "../libtreedump/include/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(ThreadPool, RunsEveryTaskBeforeShutdownReturns) {
    std::atomic<int> counter{0};
    ThreadPool pool(4);
    for (int i = 0; i < 1000; ++i) {
        pool.enqueue([&counter] { ++counter; });
    }
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1000);
}

TEST(ThreadPool, DefaultsAndZeroThreads) {
    ThreadPool four(4);
    EXPECT_EQ(four.size(), 4u);
    EXPECT_EQ(four.capacity(), 16u);

    ThreadPool zero(0, 3);
    EXPECT_EQ(zero.size(), 1u);
    EXPECT_EQ(zero.capacity(), 3u);
}

TEST(ThreadPool, SingleWorkerKeepsFifoOrder) {
    std::vector<int> order;
    std::mutex mtx;
    ThreadPool pool(1, 2);
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([i, &order, &mtx] {
            std::lock_guard lock(mtx);
            order.push_back(i);
        });
    }
    pool.shutdown();
    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) EXPECT_EQ(order[i], i);
}

TEST(ThreadPool, EnqueueBlocksWhileQueueIsFull) {
    std::atomic<bool> release{false};
    std::atomic<int> enqueued{0};
    ThreadPool pool(1, 1);

    // occupies the only worker until released
    pool.enqueue([&release] {
        while (!release) std::this_thread::sleep_for(1ms);
    });

    std::thread producer([&] {
        for (int i = 0; i < 3; ++i) {
            pool.enqueue([] {});
            ++enqueued;
        }
    });

    std::this_thread::sleep_for(100ms);
    // one task may have been taken by the worker before it blocked, one fits the queue
    EXPECT_LE(enqueued.load(), 2);

    release = true;
    producer.join();
    EXPECT_EQ(enqueued.load(), 3);
    pool.shutdown();
}

TEST(ThreadPool, ThrowingTaskDoesNotStopWorker) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    pool.enqueue([] { throw std::runtime_error("task failure"); });
    pool.enqueue([&counter] { ++counter; });
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPool, EnqueueAfterShutdownThrows) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_THROW(pool.enqueue([] {}), std::runtime_error);
    // idempotent
    EXPECT_NO_THROW(pool.shutdown());
}

TEST(ThreadPool, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(2, 100);
        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&counter] {
                std::this_thread::sleep_for(100us);
                ++counter;
            });
        }
    }
    EXPECT_EQ(counter.load(), 100);
}
