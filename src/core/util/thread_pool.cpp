#include "framectl/core/util/thread_pool.hpp"
#include "framectl/core/util/logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace framectl {

    ThreadPool::ThreadPool(size_t workers, std::string name)
        : name_(std::move(name)) {
        if (workers == 0) workers = std::max(2u, std::thread::hardware_concurrency());
        workers_.reserve(workers);
        for (size_t i = 0; i < workers; ++i)
            workers_.emplace_back([this](std::stop_token st) { workerLoop(st); });
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::post(Job job) {
        {
            std::lock_guard lk(mx_);
            if (!open_) throw std::logic_error(std::format("{}: post after shutdown", name_));
            queue_.push_back(std::move(job));
        }
        wake_.notify_one();
    }

    void ThreadPool::shutdown() {
        std::vector<std::jthread> workers;
        {
            std::lock_guard lk(mx_);
            open_ = false;
            workers.swap(workers_);
        }
        for (auto& w : workers) w.request_stop();
        for (auto& w : workers) {
            if (w.get_id() == std::this_thread::get_id()) w.detach();
            else if (w.joinable()) w.join();
        }
    }

    size_t ThreadPool::workers() const {
        std::lock_guard lk(mx_);
        return workers_.size();
    }

    size_t ThreadPool::queued() const {
        std::lock_guard lk(mx_);
        return queue_.size();
    }

    void ThreadPool::workerLoop(std::stop_token st) {
        for (;;) {
            Job job;
            {
                std::unique_lock lk(mx_);
                // Returns early on stop; whatever is still queued runs before exit.
                wake_.wait(lk, st, [this] { return !queue_.empty(); });
                if (queue_.empty()) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR(std::format("{}: job failed: {}", name_, e.what()));
            }
        }
    }

}
