/**
 * @file websocket_transport.hpp
 * @brief ITransport over ws:// or wss:// using Boost.Beast.
 *
 * All socket work runs on a private io_context thread. Outbound frames are
 * queued there, so at most one write is ever in flight on the wire.
 * TLS accepts the television's self-signed certificate.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include "framectl/core/interfaces/itransport.hpp"

namespace framectl {

    /**
     * @struct WebSocketOptions
     * @brief Tunables for WebSocketTransport.
     */
    struct WebSocketOptions {
        std::string                 userAgent{ "framectl" };
        std::size_t                 maxFrameBytes{ 16 * 1024 * 1024 };
        std::chrono::milliseconds   closeGrace{ 2000 };   ///< time allowed for the close handshake
    };

    class WebSocketTransport : public ITransport {
    public:
        explicit WebSocketTransport(WebSocketOptions opts = {});
        ~WebSocketTransport() override;

        WebSocketTransport(const WebSocketTransport&) = delete;
        WebSocketTransport& operator=(const WebSocketTransport&) = delete;

        void connect(const Endpoint& ep, std::chrono::milliseconds timeout) override;
        void send(const std::string& frame) override;
        std::optional<std::string> receive() override;
        void close() override;
        std::optional<TransportError> lastError() const override;

        /**
         * @brief Factory producing fresh WebSocketTransport instances.
         */
        static TransportFactory factory(WebSocketOptions opts = {});

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
