// ====================================================================================
// RAINMETA - ThreadPool
// ====================================================================================

#ifndef RAINMETA_THREAD_POOL_HPP_
#define RAINMETA_THREAD_POOL_HPP_

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "rainmeta/status.hpp"

namespace rainmeta::v1 {

class ThreadPool {
public:
    // The thread count only applies to the first call. It is the starting size;
    // SubmitConcurrently grows the pool when it runs short of idle workers.
    static ThreadPool& GetInstance(size_t threads = 0) {
        static ThreadPool instance(threads);
        return instance;
    }

    util::Status Submit(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) return util::Status::Error("submit on stopped ThreadPool");
            tasks_.emplace(std::move(task));
        }
        condition_.notify_one();
        return util::Status::Ok();
    }

    // Every task in the batch starts without waiting for a busy worker. Workers held
    // by earlier long-running tasks do not count as available.
    util::Status SubmitConcurrently(std::vector<std::function<void()>> batch) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) return util::Status::Error("submit on stopped ThreadPool");
            const size_t needed = active_ + tasks_.size() + batch.size();
            while (workers_.size() < needed) SpawnWorker();
            for (auto& task : batch) tasks_.emplace(std::move(task));
        }
        condition_.notify_all();
        return util::Status::Ok();
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return workers_.size();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    explicit ThreadPool(size_t threads) : active_(0), stop_(false) {
        size_t num_threads = (threads == 0) ? std::thread::hardware_concurrency() : threads;
        if (num_threads == 0) num_threads = 1;
        std::unique_lock<std::mutex> lock(queue_mutex_);
        for (size_t i = 0; i < num_threads; ++i) SpawnWorker();
    }
    ~ThreadPool() {
        { std::unique_lock<std::mutex> lock(queue_mutex_); stop_ = true; }
        condition_.notify_all();
        for (std::thread& worker : workers_) worker.join();
    }

    // Caller holds queue_mutex_.
    void SpawnWorker() {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);
                    this->condition_.wait(lock, [this] { return this->stop_ || !this->tasks_.empty(); });
                    if (this->stop_ && this->tasks_.empty()) return;
                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                    ++this->active_;
                }
                task();
                std::unique_lock<std::mutex> lock(this->queue_mutex_);
                --this->active_;
            }
        });
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    size_t active_;
    bool stop_;
};

}  // namespace rainmeta::v1

#endif  // RAINMETA_THREAD_POOL_HPP_
