/**
 * @file mdns_probe.hpp
 * @brief DNS-SD browse through the Avahi client library.
 *
 * Built without Avahi, run() reports the probe as unavailable.
 */
#pragma once
#include <string>
#include "framectl/core/interfaces/idiscovery_probe.hpp"

namespace framectl {

    class MdnsProbe : public IDiscoveryProbe {
    public:
        explicit MdnsProbe(std::string serviceType) : serviceType_(std::move(serviceType)) {}

        DiscoveryMethod method() const override { return DiscoveryMethod::Mdns; }

        void run(std::chrono::steady_clock::time_point deadline,
                 std::stop_token stop,
                 const Sink& sink) override;

        static bool available();

    private:
        std::string serviceType_;
    };

}
