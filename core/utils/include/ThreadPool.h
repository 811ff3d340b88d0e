#pragma once

#include "Result.h"

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <exception>
#include <stdexcept>
#include <cstddef>

namespace RelayPipe {

    /**
     * @brief Worker thread pool with an optionally bounded backlog.
     *
     * The relay server hands each accepted connection to its own pool and
     * answers "busy" when the backlog is full. The chunk codec fans
     * encode/decode work out with mapOrdered() on the global() pool.
     */
    class ThreadPool {
    public:
        /**
         * @param threadCount workers to start, 0 for one per hardware thread
         * @param maxQueued   tasks allowed to wait for a worker, 0 for no limit
         */
        explicit ThreadPool(std::size_t threadCount, std::size_t maxQueued = 0);
        ~ThreadPool();

        /// Shared pool sized to the hardware, created on first use
        static ThreadPool& global() {
            static ThreadPool instance(0);
            return instance;
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a task unless the pool is stopping or its backlog is full.
         * @return ShuttingDown after shutdown(), RateLimited when the backlog is
         *         at maxQueued. A rejected task is not run.
         */
        VoidResult tryPost(std::function<void()> task);

        /**
         * @brief Queue a task and return a future for its completion.
         *
         * Ignores the backlog limit. After shutdown() the task is dropped and
         * the future reports std::future_errc::broken_promise.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            auto task = std::make_shared<std::packaged_task<void()>>(std::forward<F>(func));
            std::future<void> fut = task->get_future();
            post([task]() { (*task)(); }, false);
            return fut;
        }

        /**
         * @brief Run fn(0) .. fn(count - 1) on the pool and collect the results
         *        in index order.
         *
         * Waits for every queued task before returning. The first exception
         * thrown by a task, or a runtime_error if the pool is shut down, is
         * rethrown.
         */
        template<typename T, typename F>
        std::vector<T> mapOrdered(std::size_t count, F fn) {
            std::vector<std::future<T>> futures;
            futures.reserve(count);
            std::exception_ptr failure;
            for (std::size_t i = 0; i < count; ++i) {
                auto task = std::make_shared<std::packaged_task<T()>>([&fn, i]() { return fn(i); });
                auto fut = task->get_future();
                auto queued = post([task]() { (*task)(); }, false);
                if (!queued) {
                    failure = std::make_exception_ptr(std::runtime_error(queued.error().toString()));
                    break;
                }
                futures.push_back(std::move(fut));
            }

            // Tasks already queued still reference fn, so they are always waited for
            std::vector<T> results;
            results.reserve(futures.size());
            for (auto& fut : futures) {
                try {
                    results.push_back(fut.get());
                } catch (...) {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
            if (failure) {
                std::rethrow_exception(failure);
            }
            return results;
        }

        std::size_t size() const { return threadCount_; }
        std::size_t maxQueued() const { return maxQueued_; }

        /// Tasks queued but not yet picked up by a worker
        std::size_t pending() const;

        /// Tasks turned away by tryPost() because the backlog was full
        std::size_t rejected() const;

        /**
         * @brief Stop all workers after draining the queue.
         */
        void shutdown();

    private:
        void workerLoop();
        VoidResult post(std::function<void()> task, bool bounded);

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::size_t threadCount_{0};
        std::size_t maxQueued_{0};
        std::size_t rejected_{0};
        bool stopping_{false};
    };

} // namespace RelayPipe
