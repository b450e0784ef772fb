//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

ThreadPool::ThreadPool(unsigned threads, const std::size_t capacity)
    : capacity_(capacity) {
    if (threads == 0) threads = 1;
    if (capacity_ == 0) capacity_ = static_cast<std::size_t>(threads) * 4;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    Logger::log(LogLevel::Debug,
                "Started " + std::to_string(threads) + " workers, queue capacity " + std::to_string(capacity_),
                "pool");
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            not_empty_.wait(lock, [this] {
                return closed_ || !tasks_.empty();
            });
            if (tasks_.empty())
                return; // closed and drained
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        not_full_.notify_one();
        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled exception in worker: ") + e.what(), "pool");
        }
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock lock(queue_mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || tasks_.size() < capacity_;
        });
        if (closed_) throw std::runtime_error("enqueue on closed ThreadPool");
        tasks_.push(std::move(task));
    }
    not_empty_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}
