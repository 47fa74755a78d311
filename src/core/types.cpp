#include "framectl/core/types.hpp"

namespace framectl {

    const char* toString(DiscoveryMethod m) {
        switch (m) {
        case DiscoveryMethod::Mdns:   return "mdns";
        case DiscoveryMethod::Ssdp:   return "ssdp";
        case DiscoveryMethod::Manual: return "manual";
        }
        return "unknown";
    }

    const char* toString(SessionState s) {
        switch (s) {
        case SessionState::Disconnected:   return "Disconnected";
        case SessionState::Connecting:     return "Connecting";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Ready:          return "Ready";
        case SessionState::Degraded:       return "Degraded";
        case SessionState::Closed:         return "Closed";
        }
        return "Unknown";
    }

}
