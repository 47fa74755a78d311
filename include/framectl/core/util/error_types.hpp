/**
 * @file error_types.hpp
 * @brief Error taxonomy for framectl.
 *
 * Every failed operation surfaces as an exception derived from framectl::Error.
 * Asynchronous calls store the same exceptions in their futures.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace framectl {

    /**
     * @enum ErrorCode
     * @brief Flat code table shared by all error types.
     */
    enum class ErrorCode : int {
        TransportRefused = 1,     ///< Connection refused or unresolvable host
        TransportTimeout,         ///< Connect or handshake did not finish in time
        TransportDisconnected,    ///< Channel dropped mid-stream
        TransportClosed,          ///< Operation on a closed transport
        Handshake,                ///< Protocol handshake failed
        AuthRejected,             ///< Device refused the token / pairing
        AuthExpired,              ///< Stored token expired
        AuthScopeInsufficient,    ///< Token does not permit the operation
        CallTimeout,              ///< No response before the deadline
        CallCancelled,            ///< Session closed or degraded while pending
        CallProtocol,             ///< Response payload malformed
        CallRemote,               ///< Device reported a failure
        RequestNetwork,           ///< Companion request could not be exchanged
        RequestStatus,            ///< Companion request returned non-2xx
        RequestMalformedBody,     ///< Companion response body unparseable
        DiscoveryUnavailable,     ///< Probe not supported on this platform
        Validation = 90,          ///< Invalid caller input
        Internal = 99
    };

    const char* toString(ErrorCode c);

    /**
     * @class Error
     * @brief Base class of every framectl failure.
     */
    class Error : public std::runtime_error {
    public:
        Error(ErrorCode code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}
        ErrorCode code() const noexcept { return code_; }
    private:
        ErrorCode code_;
    };

    class TransportError : public Error {
    public:
        enum class Kind { Refused, Timeout, Disconnected, Closed };
        TransportError(Kind k, const std::string& msg)
            : Error(codeFor(k), msg), kind_(k) {}
        Kind kind() const noexcept { return kind_; }
    private:
        static ErrorCode codeFor(Kind k) {
            switch (k) {
            case Kind::Refused:      return ErrorCode::TransportRefused;
            case Kind::Timeout:      return ErrorCode::TransportTimeout;
            case Kind::Disconnected: return ErrorCode::TransportDisconnected;
            default:                 return ErrorCode::TransportClosed;
            }
        }
        Kind kind_;
    };

    class HandshakeError : public Error {
    public:
        explicit HandshakeError(const std::string& msg) : Error(ErrorCode::Handshake, msg) {}
    };

    class AuthenticationError : public Error {
    public:
        enum class Kind { Rejected, Expired, ScopeInsufficient };
        AuthenticationError(Kind k, const std::string& msg)
            : Error(k == Kind::Rejected ? ErrorCode::AuthRejected
                  : k == Kind::Expired  ? ErrorCode::AuthExpired
                                        : ErrorCode::AuthScopeInsufficient, msg),
              kind_(k) {}
        Kind kind() const noexcept { return kind_; }
    private:
        Kind kind_;
    };

    /**
     * @class CallError
     * @brief Failure of a correlated control-channel call.
     *
     * For Kind::Remote, remoteCode() holds the device-reported code (may be empty).
     */
    class CallError : public Error {
    public:
        enum class Kind { Timeout, Cancelled, Protocol, Remote };
        CallError(Kind k, const std::string& msg, std::string remoteCode = {})
            : Error(k == Kind::Timeout   ? ErrorCode::CallTimeout
                  : k == Kind::Cancelled ? ErrorCode::CallCancelled
                  : k == Kind::Protocol  ? ErrorCode::CallProtocol
                                         : ErrorCode::CallRemote, msg),
              kind_(k), remoteCode_(std::move(remoteCode)) {}
        Kind kind() const noexcept { return kind_; }
        const std::string& remoteCode() const noexcept { return remoteCode_; }
    private:
        Kind        kind_;
        std::string remoteCode_;
    };

    class RequestError : public Error {
    public:
        enum class Kind { Network, Status, MalformedBody };
        RequestError(Kind k, const std::string& msg, int status = 0)
            : Error(k == Kind::Network ? ErrorCode::RequestNetwork
                  : k == Kind::Status  ? ErrorCode::RequestStatus
                                       : ErrorCode::RequestMalformedBody, msg),
              kind_(k), status_(status) {}
        Kind kind() const noexcept { return kind_; }
        int status() const noexcept { return status_; }
    private:
        Kind kind_;
        int  status_;
    };

    class DiscoveryError : public Error {
    public:
        explicit DiscoveryError(const std::string& msg) : Error(ErrorCode::DiscoveryUnavailable, msg) {}
    };

    class ValidationError : public Error {
    public:
        explicit ValidationError(const std::string& msg) : Error(ErrorCode::Validation, msg) {}
    };

}
