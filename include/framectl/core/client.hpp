/**
 * @file client.hpp
 * @brief FrameClient: everything needed to drive one television.
 *
 * Owns the control-channel session and the companion client for a device and
 * exposes the command groups built on top of them.
 */
#pragma once
#include <memory>
#include <string>
#include "framectl/core/interfaces/ihttp_exchange.hpp"
#include "framectl/core/interfaces/itoken_store.hpp"
#include "framectl/core/interfaces/itransport.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/types.hpp"
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/rpc/event_router.hpp"

namespace framectl {

    class ConnectionSession;
    class RemoteControl;
    class ContentController;
    class AppManager;

    class FrameClient {
    public:
        /**
         * @param host      TV address
         * @param opts      options for every layer
         * @param store     optional token persistence
         * @param transport transport factory; defaults to WebSocketTransport
         * @param exchange  HTTP exchange; defaults to BeastHttpExchange
         */
        explicit FrameClient(std::string host,
                             ClientOptions opts = {},
                             std::shared_ptr<ITokenStore> store = nullptr,
                             TransportFactory transport = nullptr,
                             std::shared_ptr<IHttpExchange> exchange = nullptr);

        /**
         * @brief Disconnects the session.
         */
        ~FrameClient();

        FrameClient(const FrameClient&) = delete;
        FrameClient& operator=(const FrameClient&) = delete;

        void connect();
        void disconnect();
        SessionState state() const;

        RemoteControl&      remote();
        ContentController&  content();
        AppManager&         apps();

        ConnectionSession&  session();
        CompanionAPIClient& companion();

        DeviceInfo deviceInfo();

        /// @name Observer hooks
        /// @{
        HandlerId addRawObserver(EventRouter::RawObserver cb);
        bool removeRawObserver(HandlerId id);
        HandlerId addEventObserver(EventRouter::EventObserver cb);
        bool removeEventObserver(HandlerId id);
        HandlerId addRestObserver(CompanionAPIClient::Observer cb);
        bool removeRestObserver(HandlerId id);
        HandlerId onStateChange(StateObserver cb);
        bool removeStateObserver(HandlerId id);
        /// @}

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
