/**
 * @file connection_session.hpp
 * @brief Control-channel session for one television.
 *
 * State machine:
 *
 *   Disconnected -> Connecting -> Authenticating -> Ready
 *   Connecting / Authenticating -> Closed            (connect() throws)
 *   Ready -> Degraded -> Authenticating -> Ready     (automatic reconnect)
 *   Degraded -> Closed                               (retries exhausted / disconnect())
 *   Ready -> Closed                                  (disconnect())
 *
 * Entering Closed or Degraded fails every pending call with
 * CallError::Cancelled. Observer registrations belong to the session and
 * survive reconnection.
 *
 * While Ready, an optional health probe runs every healthCheck.interval; a
 * failed probe drops the channel and the reconnect policy takes over.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "framectl/core/auth/auth_store.hpp"
#include "framectl/core/interfaces/itransport.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/rpc/correlation_engine.hpp"
#include "framectl/core/rpc/event_router.hpp"
#include "framectl/core/types.hpp"
#include "framectl/core/util/observer_registry.hpp"

namespace framectl {

    class ConnectionSession {
    public:
        /// Checks the device is still answering; throws on failure.
        using HealthProbe = std::function<void(std::chrono::milliseconds timeout)>;

        /**
         * @param host      TV address; also the device id the token is bound to
         * @param opts      session options
         * @param factory   creates a fresh transport for every connection attempt
         * @param store     optional token persistence
         */
        ConnectionSession(std::string host,
                          SessionOptions opts,
                          TransportFactory factory,
                          std::shared_ptr<ITokenStore> store = nullptr);

        /**
         * @brief Disconnects, joining the reader thread.
         */
        ~ConnectionSession();

        ConnectionSession(const ConnectionSession&) = delete;
        ConnectionSession& operator=(const ConnectionSession&) = delete;

        /**
         * @brief Open the channel and authenticate. Blocks until Ready.
         *
         * Allowed from Disconnected or Closed only. A concurrent disconnect()
         * aborts the handshake and makes connect() throw TransportError(Closed).
         * @throws TransportError, HandshakeError, AuthenticationError (state is Closed afterwards)
         * @throws std::logic_error if the session is already active, or if
         *         called from a callback running on the session's reader thread
         */
        void connect();

        /**
         * @brief Close the session. Idempotent; interrupts a connect() in progress.
         */
        void disconnect();

        /**
         * @brief Install the liveness probe used by the periodic health check.
         *
         * Without a probe no health check runs. Takes effect on the next connect().
         */
        void setHealthProbe(HealthProbe probe);

        SessionState state() const;
        bool isReady() const { return state() == SessionState::Ready; }

        /**
         * @brief Issue a correlated call.
         * @throws TransportError(Closed) if the session is not Ready
         */
        std::future<nlohmann::json> callAsync(const std::string& method,
                                              const nlohmann::json& params,
                                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        std::future<nlohmann::json> callAsync(const std::string& method,
                                              const CorrelationEngine::ParamsFn& params,
                                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        /**
         * @brief Blocking call; rethrows the CallError / TransportError of the future.
         */
        nlohmann::json call(const std::string& method,
                            const nlohmann::json& params,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        /**
         * @brief Send a correlated frame without waiting for a reply.
         */
        std::string post(const std::string& method, const nlohmann::json& params);

        HandlerId onStateChange(StateObserver cb) { return stateObservers_.add(std::move(cb)); }
        bool removeStateObserver(HandlerId id)    { return stateObservers_.remove(id); }

        EventRouter&         router()      { return router_; }
        CorrelationEngine&   correlation() { return engine_; }
        AuthStore&           auth()        { return auth_; }
        const std::string&   host() const  { return host_; }
        const SessionOptions& options() const { return opts_; }

        /**
         * @brief Endpoint the next attempt will connect to, carrying the presentable token.
         */
        Endpoint endpoint();

    private:
        enum class Handshake { Waiting, Accepted, Rejected };

        void establish(bool reconnecting);
        void readerLoop(std::stop_token st);
        bool reconnect(std::stop_token st);
        void healthLoop(std::stop_token st);
        void stopHealthCheck();
        void enterClosed(const std::string& why);
        void setState(SessionState s);
        void sendFrame(const std::string& frame);
        void handleFrame(const std::string& frame);
        std::shared_ptr<ITransport> currentTransport() const;

        std::string                         host_;
        SessionOptions                      opts_;
        TransportFactory                    factory_;
        AuthStore                           auth_;
        std::shared_ptr<IProtocol>          protocol_;
        CorrelationEngine                   engine_;
        EventRouter                         router_;
        ObserverRegistry<SessionState, SessionState> stateObservers_;

        mutable std::mutex                  mx_;
        std::condition_variable             cv_;
        SessionState                        state_{ SessionState::Disconnected };
        std::shared_ptr<ITransport>         transport_;
        Handshake                           handshake_{ Handshake::Waiting };
        std::string                         handshakeDetail_;
        std::atomic_bool                    closing_{ false };
        HealthProbe                         healthProbe_;

        std::mutex                          sendMx_;
        std::recursive_mutex                lifecycleMx_;
        std::jthread                        reader_;
        std::jthread                        health_;
    };

}
