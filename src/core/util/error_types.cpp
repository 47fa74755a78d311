#include "framectl/core/util/error_types.hpp"

namespace framectl {

    const char* toString(ErrorCode c) {
        switch (c) {
        case ErrorCode::TransportRefused:      return "transport-refused";
        case ErrorCode::TransportTimeout:      return "transport-timeout";
        case ErrorCode::TransportDisconnected: return "transport-disconnected";
        case ErrorCode::TransportClosed:       return "transport-closed";
        case ErrorCode::Handshake:             return "handshake";
        case ErrorCode::AuthRejected:          return "auth-rejected";
        case ErrorCode::AuthExpired:           return "auth-expired";
        case ErrorCode::AuthScopeInsufficient: return "auth-scope-insufficient";
        case ErrorCode::CallTimeout:           return "call-timeout";
        case ErrorCode::CallCancelled:         return "call-cancelled";
        case ErrorCode::CallProtocol:          return "call-protocol";
        case ErrorCode::CallRemote:            return "call-remote";
        case ErrorCode::RequestNetwork:        return "request-network";
        case ErrorCode::RequestStatus:         return "request-status";
        case ErrorCode::RequestMalformedBody:  return "request-malformed-body";
        case ErrorCode::DiscoveryUnavailable:  return "discovery-unavailable";
        case ErrorCode::Validation:            return "validation";
        case ErrorCode::Internal:              return "internal";
        }
        return "unknown";
    }

}
