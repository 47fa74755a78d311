#include "framectl/core/client.hpp"
#include "framectl/commands/app_manager.hpp"
#include "framectl/commands/content_controller.hpp"
#include "framectl/commands/remote_control.hpp"
#include "framectl/core/session/connection_session.hpp"
#include "framectl/core/util/logger.hpp"
#include "framectl/transports/websocket/websocket_transport.hpp"
#include <format>

namespace framectl {

    struct FrameClient::Impl {
        CompanionAPIClient  companion_;
        ConnectionSession   session_;
        RemoteControl       remote_;
        ContentController   content_;
        AppManager          apps_;

        Impl(const std::string& host,
             const ClientOptions& opts,
             std::shared_ptr<ITokenStore> store,
             TransportFactory transport,
             std::shared_ptr<IHttpExchange> exchange)
            : companion_(host, opts.companion, std::move(exchange)),
              session_(host, opts.session,
                       transport ? std::move(transport) : WebSocketTransport::factory(),
                       std::move(store)),
              remote_(session_, opts.remote),
              content_(session_, companion_, opts.content),
              apps_(session_, companion_, opts.session.callTimeout) {
            // A half-open control channel still looks Ready; the device-info
            // endpoint answers only while the television is reachable.
            session_.setHealthProbe([this](std::chrono::milliseconds timeout) {
                companion_.request("GET", "/api/v2/", { { "Accept", "application/json" } }, {}, timeout);
            });
        }
    };

    FrameClient::FrameClient(std::string host,
                             ClientOptions opts,
                             std::shared_ptr<ITokenStore> store,
                             TransportFactory transport,
                             std::shared_ptr<IHttpExchange> exchange)
        : pImpl_(std::make_unique<Impl>(host, opts, std::move(store), std::move(transport), std::move(exchange))) {
        LOG_DEBUG(std::format("client for {} created", host));
    }

    FrameClient::~FrameClient() {
        pImpl_->session_.disconnect();
    }

    void FrameClient::connect()             { pImpl_->session_.connect(); }
    void FrameClient::disconnect()          { pImpl_->session_.disconnect(); }
    SessionState FrameClient::state() const { return pImpl_->session_.state(); }

    RemoteControl&      FrameClient::remote()    { return pImpl_->remote_; }
    ContentController&  FrameClient::content()   { return pImpl_->content_; }
    AppManager&         FrameClient::apps()      { return pImpl_->apps_; }
    ConnectionSession&  FrameClient::session()   { return pImpl_->session_; }
    CompanionAPIClient& FrameClient::companion() { return pImpl_->companion_; }

    DeviceInfo FrameClient::deviceInfo() {
        pImpl_->session_.auth().requireScope(TokenScope::DeviceInfo);
        return pImpl_->companion_.deviceInfo();
    }

    HandlerId FrameClient::addRawObserver(EventRouter::RawObserver cb) {
        return pImpl_->session_.router().addRawObserver(std::move(cb));
    }

    bool FrameClient::removeRawObserver(HandlerId id) {
        return pImpl_->session_.router().removeRawObserver(id);
    }

    HandlerId FrameClient::addEventObserver(EventRouter::EventObserver cb) {
        return pImpl_->session_.router().addEventObserver(std::move(cb));
    }

    bool FrameClient::removeEventObserver(HandlerId id) {
        return pImpl_->session_.router().removeEventObserver(id);
    }

    HandlerId FrameClient::addRestObserver(CompanionAPIClient::Observer cb) {
        return pImpl_->companion_.addObserver(std::move(cb));
    }

    bool FrameClient::removeRestObserver(HandlerId id) {
        return pImpl_->companion_.removeObserver(id);
    }

    HandlerId FrameClient::onStateChange(StateObserver cb) {
        return pImpl_->session_.onStateChange(std::move(cb));
    }

    bool FrameClient::removeStateObserver(HandlerId id) {
        return pImpl_->session_.removeStateObserver(id);
    }

}
