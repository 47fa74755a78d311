/**
 * @file ssdp_probe.hpp
 * @brief SSDP M-SEARCH probe (UDP multicast 239.255.255.250:1900).
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "framectl/core/interfaces/idiscovery_probe.hpp"

namespace framectl {

    class SsdpProbe : public IDiscoveryProbe {
    public:
        explicit SsdpProbe(std::string searchTarget, int mx = 3)
            : searchTarget_(std::move(searchTarget)), mx_(mx) {}

        DiscoveryMethod method() const override { return DiscoveryMethod::Ssdp; }

        void run(std::chrono::steady_clock::time_point deadline,
                 std::stop_token stop,
                 const Sink& sink) override;

        std::string searchRequest() const;

    private:
        std::string searchTarget_;
        int         mx_;
    };

    /**
     * @brief Parse one SSDP response datagram.
     *
     * Accepts responses whose ST or USN names @p searchTarget, or whose SERVER
     * header identifies a Samsung device. The address comes from LOCATION,
     * falling back to @p sender.
     */
    std::optional<Device> parseSsdpResponse(std::string_view datagram,
                                            const std::string& sender,
                                            const std::string& searchTarget);

}
