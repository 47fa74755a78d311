/**
 * @file types.hpp
 * @brief Common value types for framectl.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace framectl {

    /// Opaque identifier returned by every observer registration.
    using HandlerId = std::uint64_t;

    /// Control-channel security mode. Plain is ws (port 8001), Tls is wss (port 8002).
    enum class SecurityMode { Plain, Tls };

    inline constexpr uint16_t kPlainPort = 8001;
    inline constexpr uint16_t kTlsPort   = 8002;

    inline uint16_t defaultPort(SecurityMode m) { return m == SecurityMode::Tls ? kTlsPort : kPlainPort; }

    /**
     * @struct Endpoint
     * @brief Where a transport connects: host, port, channel path and query.
     */
    struct Endpoint {
        std::string  host;
        uint16_t     port{ kTlsPort };
        SecurityMode security{ SecurityMode::Tls };
        std::string  target{ "/" };   ///< path + query, e.g. /api/v2/channels/...?name=...
    };

    /**
     * @enum DiscoveryMethod
     * @brief Which probe produced a device.
     */
    enum class DiscoveryMethod { Mdns, Ssdp, Manual };

    const char* toString(DiscoveryMethod m);

    /**
     * @struct Device
     * @brief A television found on the network. Never mutated after construction.
     */
    struct Device {
        std::string     id;         ///< stable id; address-derived when nothing better is advertised
        std::string     name;
        std::string     address;
        uint16_t        port{ kTlsPort };
        std::string     modelName;
        DiscoveryMethod method{ DiscoveryMethod::Manual };

        /// De-duplication key: address, or advertised name when the address is absent.
        std::string identity() const { return address.empty() ? name : address; }
    };

    struct DiscoveryResult {
        Device          device;
        DiscoveryMethod method{ DiscoveryMethod::Manual };
    };

    /**
     * @enum SessionState
     * @brief ConnectionSession lifecycle.
     */
    enum class SessionState { Disconnected, Connecting, Authenticating, Ready, Degraded, Closed };

    const char* toString(SessionState s);

    using StateObserver = std::function<void(SessionState from, SessionState to)>;

}
