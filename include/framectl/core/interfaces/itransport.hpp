/**
 * @file itransport.hpp
 * @brief Interface for the control-channel frame transport.
 *
 * One ITransport instance owns one physical duplex connection. Reconnection
 * always uses a fresh instance obtained from a TransportFactory.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "framectl/core/types.hpp"
#include "framectl/core/util/error_types.hpp"

namespace framectl {

    /**
     * @class ITransport
     * @brief Send/receive JSON text frames over one connection.
     *
     * send() is not required to be safe for concurrent callers; ConnectionSession
     * serializes it. receive() is consumed by a single reader.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief Establish the channel, including TLS and the WebSocket upgrade.
         * @throws TransportError Refused or Timeout
         * @throws HandshakeError if the upgrade is rejected
         */
        virtual void connect(const Endpoint& ep, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Write one frame.
         * @throws TransportError Closed after close(), Disconnected on I/O failure
         */
        virtual void send(const std::string& frame) = 0;

        /**
         * @brief Block until the next inbound frame.
         * @return the frame, or std::nullopt once the stream has ended
         *
         * End of stream is final. lastError() tells a clean close from a failure.
         */
        virtual std::optional<std::string> receive() = 0;

        /**
         * @brief Release the channel. Idempotent; unblocks a pending receive().
         */
        virtual void close() = 0;

        /**
         * @brief The failure that ended the stream, empty after a clean close.
         */
        virtual std::optional<TransportError> lastError() const = 0;
    };

    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

}
