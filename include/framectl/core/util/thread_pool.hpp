/**
 * @file thread_pool.hpp
 * @brief Named worker pool for blocking jobs such as discovery probes.
 *
 * Jobs are fire-and-forget: a job that throws is logged under the pool's
 * name and the worker moves on. shutdown() stops intake, lets the workers
 * drain what is already queued and joins them.
 */
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace framectl {

    class ThreadPool {
    public:
        using Job = std::function<void()>;

        /**
         * @param workers number of worker threads; 0 picks hardware concurrency (at least 2)
         * @param name    used in log lines
         */
        explicit ThreadPool(size_t workers = 0, std::string name = "pool");
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a job.
         * @throws std::logic_error after shutdown()
         */
        void post(Job job);

        /**
         * @brief Stop intake, drain the queue and join the workers. Idempotent;
         *        safe from inside a job (that worker is left to finish on its own).
         */
        void shutdown();

        size_t workers() const;
        size_t queued() const;
        const std::string& name() const { return name_; }

    private:
        void workerLoop(std::stop_token st);

        std::string                     name_;
        mutable std::mutex              mx_;
        std::condition_variable_any     wake_;
        std::deque<Job>                 queue_;
        bool                            open_{ true };
        std::vector<std::jthread>       workers_;
    };

}
