#include <catch2/catch_all.hpp>
#include <algorithm>
#include <thread>
#include "framectl/core/auth/memory_token_store.hpp"
#include "framectl/core/session/connection_session.hpp"
#include "framectl/core/strategies/linear_backoff.hpp"
#include "mock_transport.hpp"

using namespace framectl;
using namespace framectl::test;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {
    SessionOptions fastOptions() {
        SessionOptions o;
        o.handshakeTimeout = 300ms;
        o.callTimeout = 500ms;
        o.reconnect.maxAttempts = 2;
        o.reconnect.backoff = std::make_shared<LinearBackoff>(20ms, 50ms);
        o.healthCheck.interval = 40ms;
        o.healthCheck.timeout = 20ms;
        return o;
    }

    bool waitForState(ConnectionSession& s, SessionState want, std::chrono::milliseconds limit = 2s) {
        auto until = SteadyClock::now() + limit;
        while (SteadyClock::now() < until) {
            if (s.state() == want) return true;
            std::this_thread::sleep_for(5ms);
        }
        return s.state() == want;
    }

    struct Transitions {
        std::mutex m;
        std::vector<SessionState> seen;
        StateObserver observer() {
            return [this](SessionState, SessionState to) {
                std::lock_guard lk(m);
                seen.push_back(to);
            };
        }
        std::vector<SessionState> get() {
            std::lock_guard lk(m);
            return seen;
        }
    };
}

TEST_CASE("successful handshake walks Connecting, Authenticating, Ready", "[session]") {
    MockServer tv;
    ConnectionSession s("10.0.0.5", fastOptions(), tv.factory());
    Transitions tr;
    s.onStateChange(tr.observer());

    s.connect();
    REQUIRE(s.isReady());
    REQUIRE(tr.get() == std::vector<SessionState>{ SessionState::Connecting, SessionState::Authenticating, SessionState::Ready });

    auto ep = tv.endpoints().at(0);
    REQUIRE(ep.host == "10.0.0.5");
    REQUIRE(ep.port == kTlsPort);
    REQUIRE(ep.security == SecurityMode::Tls);
    REQUIRE(ep.target == "/api/v2/channels/samsung.remote.control?name=ZnJhbWVjdGw=");
}

TEST_CASE("issued token is stored and presented on the next connect", "[session]") {
    MockServer tv;
    tv.onConnect = [](MockLink& l) { l.push(MockServer::connectEvent("55501")); };
    auto store = std::make_shared<MemoryTokenStore>();

    ConnectionSession s("tv", fastOptions(), tv.factory(), store);
    s.connect();
    REQUIRE(store->load());
    REQUIRE(store->load()->value == "55501");

    s.disconnect();
    REQUIRE(s.state() == SessionState::Closed);
    s.connect();
    REQUIRE(tv.endpoints().at(1).target.ends_with("&token=55501"));
}

TEST_CASE("silent device fails the handshake with a timeout", "[session]") {
    MockServer tv;
    tv.onConnect = nullptr;
    ConnectionSession s("tv", fastOptions(), tv.factory());

    auto start = SteadyClock::now();
    try {
        s.connect();
        FAIL("expected timeout");
    } catch (const TransportError& e) {
        REQUIRE(e.kind() == TransportError::Kind::Timeout);
    }
    REQUIRE(elapsedSince(start) >= 300ms);
    REQUIRE(s.state() == SessionState::Closed);
}

TEST_CASE("unauthorized handshake clears the stored token", "[session]") {
    MockServer tv;
    tv.onConnect = [](MockLink& l) { l.push(R"({"event":"ms.channel.unauthorized"})"); };
    AuthenticationToken t;
    t.value = "old";
    t.deviceId = "tv";
    auto store = std::make_shared<MemoryTokenStore>(t);

    ConnectionSession s("tv", fastOptions(), tv.factory(), store);
    try {
        s.connect();
        FAIL("expected rejection");
    } catch (const AuthenticationError& e) {
        REQUIRE(e.kind() == AuthenticationError::Kind::Rejected);
    }
    REQUIRE(s.state() == SessionState::Closed);
    REQUIRE_FALSE(store->load());
    REQUIRE(tv.endpoints().at(0).target.ends_with("&token=old"));
}

TEST_CASE("refused connection surfaces as TransportError", "[session]") {
    MockServer tv;
    tv.refuse = [](int) { return true; };
    ConnectionSession s("tv", fastOptions(), tv.factory());
    REQUIRE_THROWS_AS(s.connect(), TransportError);
    REQUIRE(s.state() == SessionState::Closed);
}

TEST_CASE("connect on an active session is a logic error", "[session]") {
    MockServer tv;
    ConnectionSession s("tv", fastOptions(), tv.factory());
    s.connect();
    REQUIRE_THROWS_AS(s.connect(), std::logic_error);
}

TEST_CASE("calls resolve and raw observers still see the response", "[session]") {
    MockServer tv;
    tv.onSend = echoResult({ {"value", "on"} });
    ConnectionSession s("tv", fastOptions(), tv.factory());

    std::mutex m;
    std::vector<std::string> raw;
    s.router().addRawObserver([&](const std::string& f) {
        std::lock_guard lk(m);
        raw.push_back(f);
    });

    s.connect();
    auto r = s.call("ms.channel.emit", { {"event", "x"} });
    REQUIRE(r["value"] == "on");

    std::lock_guard lk(m);
    REQUIRE(raw.size() == 2);   // ms.channel.connect + the response
    REQUIRE(json::parse(raw[1])["result"]["value"] == "on");
}

TEST_CASE("calls before connect are refused", "[session]") {
    MockServer tv;
    ConnectionSession s("tv", fastOptions(), tv.factory());
    REQUIRE_THROWS_AS(s.call("m", nullptr), TransportError);
    REQUIRE_THROWS_AS(s.post("m", nullptr), TransportError);
}

TEST_CASE("disconnect cancels pending calls", "[session]") {
    MockServer tv;
    ConnectionSession s("tv", fastOptions(), tv.factory());
    s.connect();
    auto fut = s.callAsync("m", json::object(), 5s);
    s.disconnect();
    try {
        fut.get();
        FAIL("expected cancellation");
    } catch (const CallError& e) {
        REQUIRE(e.kind() == CallError::Kind::Cancelled);
    }
    REQUIRE(s.state() == SessionState::Closed);
    s.disconnect();
    REQUIRE(s.state() == SessionState::Closed);
}

TEST_CASE("lost connection reconnects and keeps observers", "[session]") {
    MockServer tv;
    ConnectionSession s("tv", fastOptions(), tv.factory());
    Transitions tr;
    s.onStateChange(tr.observer());
    std::atomic_int events{ 0 };
    s.router().addEventObserver([&](const Event& e) { if (e.name == "ping") ++events; });

    s.connect();
    auto pending = s.callAsync("m", json::object(), 5s);
    tv.last()->drop();

    try {
        pending.get();
        FAIL("expected cancellation");
    } catch (const CallError& e) {
        REQUIRE(e.kind() == CallError::Kind::Cancelled);
    }
    REQUIRE(waitForState(s, SessionState::Ready));
    REQUIRE(tv.attempts() == 2);

    auto seen = tr.get();
    REQUIRE(std::find(seen.begin(), seen.end(), SessionState::Degraded) != seen.end());
    REQUIRE(seen.back() == SessionState::Ready);

    tv.last()->push(R"({"event":"ping"})");
    auto until = SteadyClock::now() + 1s;
    while (events == 0 && SteadyClock::now() < until) std::this_thread::sleep_for(5ms);
    REQUIRE(events == 1);
}

TEST_CASE("exhausted reconnect budget closes the session", "[session]") {
    MockServer tv;
    tv.refuse = [](int attempt) { return attempt > 1; };
    ConnectionSession s("tv", fastOptions(), tv.factory());
    s.connect();
    tv.last()->drop();

    REQUIRE(waitForState(s, SessionState::Closed));
    REQUIRE(tv.attempts() == 3);
    REQUIRE_THROWS_AS(s.call("m", nullptr), TransportError);
}

TEST_CASE("reconnect disabled closes on first loss", "[session]") {
    MockServer tv;
    auto o = fastOptions();
    o.reconnect.enabled = false;
    ConnectionSession s("tv", o, tv.factory());
    s.connect();
    tv.last()->drop();
    REQUIRE(waitForState(s, SessionState::Closed));
    REQUIRE(tv.attempts() == 1);
}

TEST_CASE("plain security uses port 8001", "[session]") {
    MockServer tv;
    auto o = fastOptions();
    o.security = SecurityMode::Plain;
    ConnectionSession s("tv", o, tv.factory());
    s.connect();
    REQUIRE(tv.endpoints().at(0).port == kPlainPort);
}

TEST_CASE("disconnect interrupts a connect waiting for pairing", "[session]") {
    MockServer tv;
    tv.onConnect = nullptr;
    auto o = fastOptions();
    o.handshakeTimeout = 5s;
    ConnectionSession s("tv", o, tv.factory());

    std::jthread closer([&] {
        while (tv.attempts() == 0) std::this_thread::sleep_for(1ms);
        std::this_thread::sleep_for(50ms);
        s.disconnect();
    });

    auto start = SteadyClock::now();
    try {
        s.connect();
        FAIL("expected the handshake to be aborted");
    } catch (const TransportError& e) {
        REQUIRE(e.kind() == TransportError::Kind::Closed);
    }
    REQUIRE(elapsedSince(start) < 1s);
    closer.join();
    REQUIRE(s.state() == SessionState::Closed);
}

TEST_CASE("connect from a state observer on the reader thread is rejected", "[session]") {
    MockServer tv;
    auto o = fastOptions();
    o.reconnect.enabled = false;
    ConnectionSession s("tv", o, tv.factory());

    std::atomic_bool rejected{ false };
    s.onStateChange([&](SessionState, SessionState to) {
        if (to != SessionState::Closed) return;
        try {
            s.connect();
        } catch (const std::logic_error&) {
            rejected = true;
        }
    });

    s.connect();
    tv.last()->drop();
    REQUIRE(waitForState(s, SessionState::Closed));
    auto until = SteadyClock::now() + 1s;
    while (!rejected && SteadyClock::now() < until) std::this_thread::sleep_for(5ms);
    REQUIRE(rejected);
    REQUIRE(tv.attempts() == 1);
}

TEST_CASE("failed health check degrades and reconnects", "[session]") {
    MockServer tv;
    ConnectionSession s("tv", fastOptions(), tv.factory());
    Transitions tr;
    s.onStateChange(tr.observer());

    std::atomic_int checks{ 0 };
    std::atomic<long long> seenTimeout{ 0 };
    s.setHealthProbe([&](std::chrono::milliseconds timeout) {
        seenTimeout = timeout.count();
        if (++checks == 1) throw RequestError(RequestError::Kind::Network, "no route to host");
    });

    s.connect();
    auto until = SteadyClock::now() + 2s;
    while (tv.attempts() < 2 && SteadyClock::now() < until) std::this_thread::sleep_for(5ms);
    REQUIRE(tv.attempts() == 2);
    REQUIRE(waitForState(s, SessionState::Ready));
    REQUIRE(seenTimeout == 20);

    auto seen = tr.get();
    REQUIRE(std::find(seen.begin(), seen.end(), SessionState::Degraded) != seen.end());

    // Later checks pass and leave the channel alone.
    until = SteadyClock::now() + 2s;
    while (checks < 4 && SteadyClock::now() < until) std::this_thread::sleep_for(5ms);
    REQUIRE(checks >= 4);
    REQUIRE(tv.attempts() == 2);
    REQUIRE(s.isReady());
}

TEST_CASE("disabled health check never probes", "[session]") {
    MockServer tv;
    auto o = fastOptions();
    o.healthCheck.enabled = false;
    ConnectionSession s("tv", o, tv.factory());
    std::atomic_int checks{ 0 };
    s.setHealthProbe([&](std::chrono::milliseconds) { ++checks; });

    s.connect();
    std::this_thread::sleep_for(150ms);
    REQUIRE(checks == 0);
    REQUIRE(s.isReady());
}
