/**
 * @file correlation_engine.hpp
 * @brief Matches control-channel responses to outstanding calls.
 *
 * Every call gets an id that is unique for the lifetime of the engine
 * (random per-engine prefix + monotonic counter). Each pending call carries
 * its own deadline; one timer thread expires them in deadline order.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <folly/SharedMutex.h>
#include <folly/container/F14Map.h>
#include <nlohmann/json.hpp>
#include "framectl/core/interfaces/iprotocol.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/time.hpp"

namespace framectl {

    class CorrelationEngine {
    public:
        using SendFn   = std::function<void(const std::string& frame)>;
        /// Builds call params once the correlation id is known.
        using ParamsFn = std::function<nlohmann::json(const std::string& id)>;

        explicit CorrelationEngine(std::shared_ptr<IProtocol> protocol);

        /**
         * @brief Stops the timer thread and cancels whatever is still pending.
         */
        ~CorrelationEngine();

        CorrelationEngine(const CorrelationEngine&) = delete;
        CorrelationEngine& operator=(const CorrelationEngine&) = delete;

        /**
         * @brief Register a pending call, then hand its frame to @p send.
         *
         * The future resolves with the response payload, or fails with
         * CallError (Timeout, Cancelled, Protocol, Remote). If @p send throws,
         * the call is withdrawn and the future carries that exception.
         */
        std::future<nlohmann::json> submit(const std::string& method,
                                           const ParamsFn& params,
                                           std::chrono::milliseconds timeout,
                                           const SendFn& send);

        std::future<nlohmann::json> submit(const std::string& method,
                                           const nlohmann::json& params,
                                           std::chrono::milliseconds timeout,
                                           const SendFn& send);

        /**
         * @brief Blocking form of submit().
         */
        nlohmann::json call(const std::string& method,
                            const nlohmann::json& params,
                            std::chrono::milliseconds timeout,
                            const SendFn& send);

        /**
         * @brief Send a correlated frame without waiting for a reply.
         * @return the id that was attached
         */
        std::string post(const std::string& method, const nlohmann::json& params, const SendFn& send);

        /**
         * @brief Resolve the pending call a decoded response refers to.
         * @return false if no call with that id is pending
         */
        bool resolve(const InboundFrame& frame);

        /**
         * @brief Fail every pending call with @p kind. Returns how many were failed.
         */
        size_t failAll(CallError::Kind kind, const std::string& reason);

        size_t pendingCount() const;

        bool isPending(const std::string& id) const;

        std::string nextId();

        IProtocol& protocol() { return *protocol_; }

    private:
        struct PendingCall {
            std::string                     id;
            std::string                     method;
            SteadyClock::time_point         submitted;
            SteadyClock::time_point         deadline;
            std::promise<nlohmann::json>    slot;
        };
        using PendingPtr = std::shared_ptr<PendingCall>;

        std::shared_ptr<PendingCall> take(const std::string& id);
        void timerLoop(std::stop_token st);
        void wakeTimer();

        std::shared_ptr<IProtocol>                      protocol_;
        std::string                                     prefix_;
        std::atomic_uint64_t                            nextId_{ 1 };

        folly::F14FastMap<std::string, PendingPtr>      pending_;
        mutable folly::SharedMutex                      pendMx_;

        std::mutex                                      timerMx_;
        std::condition_variable_any                     timerCv_;
        bool                                            timerDirty_{ false };
        std::jthread                                    timer_;
    };

}
