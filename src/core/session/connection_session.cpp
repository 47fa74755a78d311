#include "framectl/core/session/connection_session.hpp"
#include "framectl/core/protocol/json_protocol.hpp"
#include "framectl/core/util/logger.hpp"
#include "internal/core/util/base64.hpp"
#include <format>
#include <stdexcept>

namespace framectl {

    namespace {
        constexpr const char* kEvtConnect      = "ms.channel.connect";
        constexpr const char* kEvtUnauthorized = "ms.channel.unauthorized";
        constexpr const char* kEvtTimeOut      = "ms.channel.timeOut";
    }

    ConnectionSession::ConnectionSession(std::string host,
                                         SessionOptions opts,
                                         TransportFactory factory,
                                         std::shared_ptr<ITokenStore> store)
        : host_(std::move(host)),
          opts_(std::move(opts)),
          factory_(std::move(factory)),
          auth_(host_, std::move(store)),
          protocol_(std::make_shared<JsonProtocol>()),
          engine_(protocol_),
          router_(engine_, protocol_) {}

    ConnectionSession::~ConnectionSession() {
        disconnect();
    }

    SessionState ConnectionSession::state() const {
        std::lock_guard lk(mx_);
        return state_;
    }

    void ConnectionSession::setState(SessionState s) {
        SessionState old;
        {
            std::lock_guard lk(mx_);
            if (closing_ && s != SessionState::Closed) return;
            old = state_;
            if (old == s) return;
            state_ = s;
        }
        LOG_INFO(std::format("session {}: {} -> {}", host_, toString(old), toString(s)));
        stateObservers_.notify(old, s);
    }

    std::shared_ptr<ITransport> ConnectionSession::currentTransport() const {
        std::lock_guard lk(mx_);
        return transport_;
    }

    Endpoint ConnectionSession::endpoint() {
        Endpoint ep;
        ep.host = host_;
        ep.security = opts_.security;
        ep.port = opts_.port ? opts_.port : defaultPort(opts_.security);
        ep.target = "/api/v2/channels/" + opts_.channel + "?name=" + base64Encode(opts_.clientName);
        if (auto tok = auth_.presentable())
            ep.target += "&token=" + tok->value;
        return ep;
    }

    void ConnectionSession::connect() {
        std::lock_guard lc(lifecycleMx_);
        if (reader_.joinable() && reader_.get_id() == std::this_thread::get_id())
            throw std::logic_error(std::format("session {}: connect() from a session callback", host_));
        {
            std::lock_guard lk(mx_);
            if (state_ != SessionState::Disconnected && state_ != SessionState::Closed)
                throw std::logic_error(std::format("session {} is already {}", host_, toString(state_)));
        }
        if (reader_.joinable()) {
            reader_.request_stop();
            reader_.join();
        }
        stopHealthCheck();
        closing_ = false;

        try {
            establish(false);
            if (closing_)
                throw TransportError(TransportError::Kind::Closed, "session closed during handshake");
        } catch (const std::exception& e) {
            LOG_ERROR(std::format("connect to {} failed: {}", host_, e.what()));
            enterClosed(e.what());
            throw;
        }
        setState(SessionState::Ready);
        reader_ = std::jthread([this](std::stop_token st) { readerLoop(st); });

        bool probe;
        {
            std::lock_guard lk(mx_);
            probe = static_cast<bool>(healthProbe_);
        }
        if (opts_.healthCheck.enabled && probe)
            health_ = std::jthread([this](std::stop_token st) { healthLoop(st); });
    }

    void ConnectionSession::setHealthProbe(HealthProbe probe) {
        std::lock_guard lk(mx_);
        healthProbe_ = std::move(probe);
    }

    void ConnectionSession::stopHealthCheck() {
        if (health_.joinable() && health_.get_id() != std::this_thread::get_id()) {
            health_.request_stop();
            health_.join();
        }
    }

    void ConnectionSession::healthLoop(std::stop_token st) {
        std::mutex m;
        std::condition_variable_any cv;
        while (!st.stop_requested()) {
            {
                std::unique_lock lk(m);
                cv.wait_for(lk, st, opts_.healthCheck.interval, [] { return false; });
            }
            if (st.stop_requested() || closing_) break;

            auto s = state();
            if (s == SessionState::Closed) break;
            if (s != SessionState::Ready) continue;

            HealthProbe probe;
            {
                std::lock_guard lk(mx_);
                probe = healthProbe_;
            }
            if (!probe) break;
            try {
                probe(opts_.healthCheck.timeout);
                LOG_TRACE(std::format("health check of {} passed", host_));
            } catch (const std::exception& e) {
                if (st.stop_requested() || closing_) break;
                LOG_WARN(std::format("health check of {} failed: {}; dropping the channel", host_, e.what()));
                // The reader sees the closed transport and runs the reconnect policy.
                if (auto t = currentTransport()) t->close();
            }
        }
    }

    void ConnectionSession::establish(bool reconnecting) {
        auto deadline = SteadyClock::now() + opts_.handshakeTimeout;
        auto ep = endpoint();
        std::shared_ptr<ITransport> t = factory_();
        {
            std::lock_guard lk(mx_);
            if (closing_) throw TransportError(TransportError::Kind::Closed, "session is closing");
            transport_ = t;
            handshake_ = Handshake::Waiting;
            handshakeDetail_.clear();
        }
        if (!reconnecting) setState(SessionState::Connecting);

        LOG_DEBUG(std::format("connecting to {}://{}:{}{}", ep.security == SecurityMode::Tls ? "wss" : "ws",
                              ep.host, ep.port, ep.target));
        t->connect(ep, opts_.handshakeTimeout);
        // disconnect() may have closed the transport before it was connected.
        if (closing_) {
            t->close();
            throw TransportError(TransportError::Kind::Closed, "session closed during handshake");
        }
        if (!reconnecting) setState(SessionState::Authenticating);

        // The device answers the upgrade with ms.channel.connect (accepted) or
        // ms.channel.unauthorized; it may instead wait for the user to confirm
        // pairing on screen, so the wait is bounded by the same deadline.
        std::atomic_bool timedOut{ false };
        {
            std::jthread watchdog([&](std::stop_token st) {
                std::mutex m;
                std::condition_variable_any cv;
                std::unique_lock lk(m);
                cv.wait_until(lk, st, deadline, [] { return false; });
                if (!st.stop_requested()) {
                    timedOut = true;
                    t->close();
                }
            });
            while (auto f = t->receive()) {
                handleFrame(*f);
                std::lock_guard lk(mx_);
                if (handshake_ != Handshake::Waiting) break;
            }
            watchdog.request_stop();
        }

        Handshake hs;
        std::string detail;
        {
            std::lock_guard lk(mx_);
            hs = handshake_;
            detail = handshakeDetail_;
            if (hs != Handshake::Accepted && transport_ == t) transport_.reset();
        }
        if (hs == Handshake::Accepted) return;

        t->close();
        if (hs == Handshake::Rejected)
            throw AuthenticationError(AuthenticationError::Kind::Rejected,
                                      std::format("{} refused the pairing ({})", host_, detail));
        if (timedOut)
            throw TransportError(TransportError::Kind::Timeout,
                                 std::format("no handshake from {} within {}ms", host_, opts_.handshakeTimeout.count()));
        if (closing_)
            throw TransportError(TransportError::Kind::Closed, "session closed during handshake");
        if (auto err = t->lastError()) throw *err;
        throw HandshakeError(std::format("{} closed the channel during the handshake", host_));
    }

    void ConnectionSession::handleFrame(const std::string& frame) {
        LOG_TRACE("<< " + frame);
        auto r = router_.route(frame);
        if (r.route != Route::Event) return;

        if (r.event == kEvtConnect) {
            if (r.data.is_object()) {
                auto it = r.data.find("token");
                if (it != r.data.end() && it->is_string() && !it->get<std::string>().empty()) {
                    try {
                        auth_.acceptIssued(it->get<std::string>());
                        LOG_INFO(std::format("{} issued a new token", host_));
                    } catch (const std::exception& e) {
                        LOG_ERROR(std::format("could not store token from {}: {}", host_, e.what()));
                    }
                }
            }
            std::lock_guard lk(mx_);
            if (handshake_ == Handshake::Waiting) handshake_ = Handshake::Accepted;
        } else if (r.event == kEvtUnauthorized || r.event == kEvtTimeOut) {
            auth_.clear();
            std::lock_guard lk(mx_);
            if (handshake_ == Handshake::Waiting) {
                handshake_ = Handshake::Rejected;
                handshakeDetail_ = r.event;
            }
        }
    }

    void ConnectionSession::readerLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            auto t = currentTransport();
            if (!t) break;
            while (auto f = t->receive()) handleFrame(*f);
            if (closing_) break;

            auto err = t->lastError();
            LOG_WARN(std::format("control channel to {} lost: {}", host_, err ? err->what() : "closed by peer"));
            {
                std::lock_guard lk(mx_);
                if (transport_ == t) transport_.reset();
            }
            t->close();
            setState(SessionState::Degraded);
            engine_.failAll(CallError::Kind::Cancelled, "connection lost");

            if (!reconnect(st)) {
                if (!closing_) enterClosed("reconnect attempts exhausted");
                break;
            }
        }
    }

    bool ConnectionSession::reconnect(std::stop_token st) {
        auto const& p = opts_.reconnect;
        if (!p.enabled) return false;

        for (uint32_t attempt = 1; attempt <= p.maxAttempts; ++attempt) {
            auto delay = p.backoff ? p.backoff->nextDelay(attempt) : std::chrono::milliseconds(0);
            LOG_INFO(std::format("reconnect {}/{} to {} in {}ms", attempt, p.maxAttempts, host_, delay.count()));
            {
                std::unique_lock lk(mx_);
                if (cv_.wait_for(lk, delay, [this] { return closing_.load(); })) return false;
            }
            if (st.stop_requested() || closing_) return false;

            setState(SessionState::Authenticating);
            try {
                establish(true);
                setState(SessionState::Ready);
                return true;
            } catch (const AuthenticationError& e) {
                LOG_ERROR(std::format("reconnect to {} rejected: {}", host_, e.what()));
                return false;
            } catch (const Error& e) {
                LOG_WARN(std::format("reconnect {}/{} to {} failed: {}", attempt, p.maxAttempts, host_, e.what()));
                if (closing_) return false;
                setState(SessionState::Degraded);
            }
        }
        return false;
    }

    void ConnectionSession::enterClosed(const std::string& why) {
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard lk(mx_);
            t = std::move(transport_);
        }
        if (t) t->close();
        setState(SessionState::Closed);
        engine_.failAll(CallError::Kind::Cancelled, why);
    }

    void ConnectionSession::disconnect() {
        auto signal = [this] {
            {
                std::lock_guard lk(mx_);
                closing_ = true;
            }
            cv_.notify_all();
            if (auto t = currentTransport()) t->close();
        };
        // Signal before taking the lifecycle lock so a connect() blocked in
        // its handshake wakes up and releases it; again once holding it, in
        // case that connect() started after the first signal.
        signal();
        std::lock_guard lc(lifecycleMx_);
        signal();

        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.request_stop();
            reader_.join();
        }
        stopHealthCheck();
        auto s = state();
        if (s != SessionState::Disconnected && s != SessionState::Closed)
            enterClosed("session disconnected");
    }

    void ConnectionSession::sendFrame(const std::string& frame) {
        auto t = currentTransport();
        if (!t) throw TransportError(TransportError::Kind::Closed, "session has no open channel");
        std::lock_guard lk(sendMx_);
        LOG_TRACE(">> " + frame);
        t->send(frame);
    }

    std::future<nlohmann::json> ConnectionSession::callAsync(const std::string& method,
                                                             const CorrelationEngine::ParamsFn& params,
                                                             std::optional<std::chrono::milliseconds> timeout) {
        auto s = state();
        if (s != SessionState::Ready)
            throw TransportError(s == SessionState::Degraded ? TransportError::Kind::Disconnected
                                                             : TransportError::Kind::Closed,
                                 std::format("cannot call '{}': session is {}", method, toString(s)));
        return engine_.submit(method, params, timeout.value_or(opts_.callTimeout),
                              [this](const std::string& f) { sendFrame(f); });
    }

    std::future<nlohmann::json> ConnectionSession::callAsync(const std::string& method,
                                                             const nlohmann::json& params,
                                                             std::optional<std::chrono::milliseconds> timeout) {
        return callAsync(method, [params](const std::string&) { return params; }, timeout);
    }

    nlohmann::json ConnectionSession::call(const std::string& method,
                                           const nlohmann::json& params,
                                           std::optional<std::chrono::milliseconds> timeout) {
        return callAsync(method, params, timeout).get();
    }

    std::string ConnectionSession::post(const std::string& method, const nlohmann::json& params) {
        auto s = state();
        if (s != SessionState::Ready)
            throw TransportError(TransportError::Kind::Closed,
                                 std::format("cannot send '{}': session is {}", method, toString(s)));
        return engine_.post(method, params, [this](const std::string& f) { sendFrame(f); });
    }

}
