/**
 * @file options.hpp
 * @brief Configuration structs for framectl.
 *
 * Every field has a working default; ClientOptions::fromJson overrides any
 * subset of them from a JSON document.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "framectl/core/types.hpp"
#include "framectl/core/interfaces/IBackoffStrategy.hpp"
#include "framectl/core/strategies/exponential_backoff.hpp"

namespace framectl {

    using namespace std::chrono_literals;

    /**
     * @struct ReconnectPolicy
     * @brief Automatic reconnection after a Ready session loses its transport.
     */
    struct ReconnectPolicy {
        bool                                enabled{ true };
        uint32_t                            maxAttempts{ 5 };
        std::shared_ptr<IBackoffStrategy>   backoff{ std::make_shared<ExponentialBackoff>(1000ms, 30000ms) };
    };

    /**
     * @struct HealthCheckOptions
     * @brief Periodic liveness probe of a Ready session.
     *
     * A failed probe is treated like a lost channel: the session turns
     * Degraded and follows the reconnect policy.
     */
    struct HealthCheckOptions {
        bool                        enabled{ true };
        std::chrono::milliseconds   interval{ 30s };
        std::chrono::milliseconds   timeout{ 5s };
    };

    struct SessionOptions {
        std::string                 clientName{ "framectl" };  ///< shown on the TV pairing prompt
        SecurityMode                security{ SecurityMode::Tls };
        uint16_t                    port{ 0 };                 ///< 0 = default port of the security mode
        std::string                 channel{ "samsung.remote.control" };
        std::chrono::milliseconds   handshakeTimeout{ 90s };   ///< upgrade + waiting for ms.channel.connect
        std::chrono::milliseconds   callTimeout{ 5s };
        ReconnectPolicy             reconnect;
        HealthCheckOptions          healthCheck;
    };

    struct CompanionOptions {
        uint16_t                    port{ kPlainPort };
        bool                        tls{ false };
        std::chrono::milliseconds   requestTimeout{ 10s };
    };

    struct DiscoveryOptions {
        std::string                 mdnsServiceType{ "_samsung-remote._tcp" };
        std::string                 ssdpSearchTarget{ "urn:samsung.com:device:RemoteControlReceiver:1" };
        int                         mx{ 3 };
    };

    struct RemoteOptions {
        std::chrono::milliseconds   keyDelay{ 100ms };
        bool                        awaitAck{ false };        ///< key presses are not acknowledged by most firmware
    };

    struct ContentOptions {
        std::chrono::milliseconds   artTimeout{ 8s };
        std::chrono::milliseconds   uploadTimeout{ 15s };
    };

    struct ClientOptions {
        SessionOptions      session;
        CompanionOptions    companion;
        DiscoveryOptions    discovery;
        RemoteOptions       remote;
        ContentOptions      content;

        /**
         * @brief Build options from JSON; absent keys keep their defaults.
         *
         * Durations are integer milliseconds. "reconnect.backoff" is
         * {"type": "exponential"|"linear", "baseMs": n, "maxMs": n}.
         * @throws ValidationError on wrongly typed or out-of-range values
         */
        static ClientOptions fromJson(const nlohmann::json& j);
    };

}
