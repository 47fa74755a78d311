/**
 * @file observer_registry.hpp
 * @brief Handler-id keyed callback registry with copy-on-read fan-out.
 *
 * add/remove may be called from any thread, including from inside a callback
 * that is being notified. notify() snapshots the callbacks under the lock and
 * invokes them after releasing it.
 */
#pragma once
#include <ankerl/unordered_dense.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "framectl/core/types.hpp"
#include "framectl/core/util/logger.hpp"

namespace framectl {

    template <typename... Args>
    class ObserverRegistry {
    public:
        using Callback = std::function<void(Args...)>;

        HandlerId add(Callback cb) {
            HandlerId id = nextId_.fetch_add(1, std::memory_order_relaxed);
            std::lock_guard lk(mx_);
            entries_.emplace(id, std::move(cb));
            return id;
        }

        /**
         * @return true if the id was registered
         */
        bool remove(HandlerId id) {
            std::lock_guard lk(mx_);
            return entries_.erase(id) > 0;
        }

        size_t size() const {
            std::lock_guard lk(mx_);
            return entries_.size();
        }

        std::vector<Callback> snapshot() const {
            std::lock_guard lk(mx_);
            std::vector<Callback> out;
            out.reserve(entries_.size());
            for (auto const& [id, cb] : entries_) out.push_back(cb);
            return out;
        }

        /**
         * @brief Deliver to every observer registered at the time of the call.
         *
         * An observer that throws is logged and does not stop delivery to the others.
         */
        void notify(Args... args) const {
            for (auto const& cb : snapshot()) {
                try {
                    cb(args...);
                } catch (const std::exception& e) {
                    LOG_ERROR("observer threw: " + std::string(e.what()));
                }
            }
        }

    private:
        mutable std::mutex mx_;
        ankerl::unordered_dense::map<HandlerId, Callback> entries_;
        std::atomic<HandlerId> nextId_{ 1 };
    };

}
