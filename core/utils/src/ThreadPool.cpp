#include "ThreadPool.h"

#include <string>

namespace RelayPipe {

    ThreadPool::ThreadPool(std::size_t threadCount, std::size_t maxQueued) : maxQueued_(maxQueued) {
        if (threadCount == 0) {
            auto hw = std::thread::hardware_concurrency();
            threadCount = hw == 0 ? 1 : hw;
        }

        threadCount_ = threadCount;
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    std::size_t ThreadPool::pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    std::size_t ThreadPool::rejected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_;
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }

        cv_.notify_all();

        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }

        workers_.clear();
    }

    VoidResult ThreadPool::tryPost(std::function<void()> task) {
        return post(std::move(task), true);
    }

    VoidResult ThreadPool::post(std::function<void()> task, bool bounded) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return Err(ErrorCode::ShuttingDown, "thread pool is shut down");
            }
            if (bounded && maxQueued_ > 0 && tasks_.size() >= maxQueued_) {
                ++rejected_;
                return Err(ErrorCode::RateLimited,
                           "all " + std::to_string(threadCount_) + " workers busy and " +
                           std::to_string(tasks_.size()) + " task(s) waiting");
            }
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return Ok();
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() {
                    return stopping_ || !tasks_.empty();
                });

                if (stopping_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            if (task) {
                task();
            }
        }
    }

} // namespace RelayPipe
