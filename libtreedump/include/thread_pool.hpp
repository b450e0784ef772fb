//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file thread_pool.hpp
 * @brief Defines a fixed-size thread pool draining one bounded FIFO queue.
 *
 * This file contains the ThreadPool class used by CaptureExecutor to
 * overlap file reads across several workers.
 */

#ifndef TREEDUMP_THREAD_POOL_HPP
#define TREEDUMP_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size pool of workers sharing one bounded task queue.
 *
 * @details Producers block in enqueue() while the queue holds `capacity`
 * pending tasks. shutdown() closes the queue: workers keep draining it
 * and exit once it is empty, and shutdown() returns only after every
 * worker has exited. Tasks are taken strictly in FIFO order; completion
 * order is unspecified.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the pool and starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     * @param capacity Maximum number of queued (not yet running) tasks;
     * 0 selects four slots per worker.
     */
    explicit ThreadPool(unsigned threads = 4, std::size_t capacity = 0);

    /**
     * @brief Destructor. Equivalent to shutdown().
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Appends a task to the queue, blocking while the queue is full.
     *
     * Exceptions thrown by a task are logged and swallowed by the worker,
     * which then moves on to the next task.
     *
     * @param task The callable to run on a worker thread.
     * @throws std::runtime_error if the pool has been shut down.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Closes the queue, drains it and joins every worker.
     *
     * Idempotent. Must not be called from inside a task.
     */
    void shutdown();

    /**
     * @return The number of worker threads.
     */
    [[nodiscard]] unsigned size() const { return static_cast<unsigned>(workers_.size()); }

    /**
     * @return The queue capacity in tasks.
     */
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    void worker_loop();

    std::mutex queue_mutex_;                        ///< Protects tasks_ and closed_
    std::condition_variable not_empty_;             ///< Signals workers: task available or queue closed
    std::condition_variable not_full_;              ///< Signals producers: a slot was freed
    std::queue<std::function<void()>> tasks_;       ///< Pending tasks, FIFO
    std::size_t capacity_;                          ///< Maximum size of tasks_
    bool closed_{false};                            ///< Set once by shutdown()
    std::vector<std::jthread> workers_;             ///< The worker threads
};

#endif // TREEDUMP_THREAD_POOL_HPP
