/**
 * @file idiscovery_probe.hpp
 * @brief One network discovery mechanism.
 */
#pragma once
#include <chrono>
#include <functional>
#include <stop_token>
#include "framectl/core/types.hpp"

namespace framectl {

    class IDiscoveryProbe {
    public:
        using Sink = std::function<void(Device)>;

        virtual ~IDiscoveryProbe() = default;

        virtual DiscoveryMethod method() const = 0;

        /**
         * @brief Probe until @p deadline or until stop is requested, reporting each device found.
         *
         * May report the same device more than once; the engine de-duplicates.
         * @throws DiscoveryError if the mechanism is not available here
         */
        virtual void run(std::chrono::steady_clock::time_point deadline,
                         std::stop_token stop,
                         const Sink& sink) = 0;
    };

}
