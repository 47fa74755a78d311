/**
 * @file discovery_engine.hpp
 * @brief Concurrent, de-duplicated device discovery.
 *
 * discover() starts every probe on the engine's pool and returns a stream
 * that yields each device the first time any probe reports it. The stream
 * ends when the timeout elapses, every probe has finished, or cancel() is
 * called. Nothing is yielded after cancel() returns.
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "framectl/core/interfaces/idiscovery_probe.hpp"
#include "framectl/core/interfaces/ihttp_exchange.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/types.hpp"
#include "framectl/core/util/thread_pool.hpp"

namespace framectl {

    namespace detail { struct DiscoveryCycle; }

    /**
     * @class DiscoveryStream
     * @brief Pull-style handle on one discovery cycle.
     */
    class DiscoveryStream {
    public:
        explicit DiscoveryStream(std::shared_ptr<detail::DiscoveryCycle> cycle);

        /**
         * @brief Block until the next unseen device, or std::nullopt once the cycle is over.
         */
        std::optional<DiscoveryResult> next();

        /**
         * @brief Drain the stream into a vector.
         */
        std::vector<DiscoveryResult> collect();

        void cancel();

    private:
        std::shared_ptr<detail::DiscoveryCycle> cycle_;
    };

    class DiscoveryEngine {
    public:
        /**
         * @param probes    probes to run; empty selects the built-in mDNS and SSDP probes
         * @param exchange  HTTP exchange used by find(); defaults to Boost.Beast
         */
        explicit DiscoveryEngine(DiscoveryOptions opts = {},
                                 std::vector<std::shared_ptr<IDiscoveryProbe>> probes = {},
                                 std::shared_ptr<IHttpExchange> exchange = nullptr);
        ~DiscoveryEngine();

        DiscoveryEngine(const DiscoveryEngine&) = delete;
        DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

        /**
         * @throws std::logic_error if the previous stream is still running
         */
        DiscoveryStream discover(std::chrono::milliseconds timeout);

        /**
         * @brief Cancel the running cycle, if any. Idempotent.
         */
        void cancel();

        /**
         * @brief Query one host directly through its companion surface.
         * @throws RequestError if the host does not answer like a television
         */
        DiscoveryResult find(const std::string& host, CompanionOptions companion = {});

    private:
        DiscoveryOptions                                opts_;
        std::vector<std::shared_ptr<IDiscoveryProbe>>   probes_;
        std::shared_ptr<IHttpExchange>                  exchange_;
        std::mutex                                      mx_;
        std::shared_ptr<detail::DiscoveryCycle>         active_;
        ThreadPool                                      pool_;
    };

}
