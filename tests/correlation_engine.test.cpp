#include <catch2/catch_all.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include "framectl/core/protocol/json_protocol.hpp"
#include "framectl/core/rpc/correlation_engine.hpp"

using namespace framectl;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {
    struct Wire {
        std::mutex m;
        std::vector<json> frames;
        CorrelationEngine::SendFn fn() {
            return [this](const std::string& f) {
                std::lock_guard lk(m);
                frames.push_back(json::parse(f));
            };
        }
    };

    InboundFrame okFrame(const std::string& id, json payload) {
        InboundFrame f;
        f.kind = FrameKind::Response;
        f.id = id;
        f.ok = true;
        f.payload = std::move(payload);
        return f;
    }
}

TEST_CASE("ids are unique across calls", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    std::vector<std::string> ids;
    for (int i = 0; i < 1000; ++i) ids.push_back(eng.nextId());
    std::sort(ids.begin(), ids.end());
    REQUIRE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

TEST_CASE("responses resolved in reverse order reach the right callers", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    constexpr int N = 16;
    std::vector<std::future<json>> futs;
    for (int i = 0; i < N; ++i) futs.push_back(eng.submit("m", json{ {"n", i} }, 2s, w.fn()));
    REQUIRE(eng.pendingCount() == N);

    for (int i = N - 1; i >= 0; --i) {
        auto const& f = w.frames[i];
        REQUIRE(eng.resolve(okFrame(f["id"], f["params"]["n"])));
    }
    for (int i = 0; i < N; ++i) REQUIRE(futs[i].get() == i);
    REQUIRE(eng.pendingCount() == 0);
}

TEST_CASE("a call times out near its own deadline", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    auto start = SteadyClock::now();
    auto slow = eng.submit("slow", json::object(), 150ms, w.fn());
    auto other = eng.submit("other", json::object(), 5s, w.fn());

    REQUIRE_THROWS_MATCHES(slow.get(), CallError,
        Catch::Matchers::Predicate<CallError>([](const CallError& e) { return e.kind() == CallError::Kind::Timeout; }));
    auto took = elapsedSince(start);
    REQUIRE(took >= 150ms);
    REQUIRE(took < 1500ms);

    // the other call is unaffected
    REQUIRE(eng.isPending(w.frames[1]["id"]));
    REQUIRE(eng.resolve(okFrame(w.frames[1]["id"], "fine")));
    REQUIRE(other.get() == "fine");
}

TEST_CASE("a late response after timeout is not matched", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    auto fut = eng.submit("m", json::object(), 50ms, w.fn());
    REQUIRE_THROWS_AS(fut.get(), CallError);
    REQUIRE_FALSE(eng.resolve(okFrame(w.frames[0]["id"], 1)));
}

TEST_CASE("failAll cancels every pending call exactly once", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    std::vector<std::future<json>> futs;
    for (int i = 0; i < 5; ++i) futs.push_back(eng.submit("m", json::object(), 5s, w.fn()));

    REQUIRE(eng.failAll(CallError::Kind::Cancelled, "closing") == 5);
    for (auto& f : futs) {
        try {
            f.get();
            FAIL("expected cancellation");
        } catch (const CallError& e) {
            REQUIRE(e.kind() == CallError::Kind::Cancelled);
        }
    }
    REQUIRE(eng.failAll(CallError::Kind::Cancelled, "again") == 0);
    REQUIRE_FALSE(eng.resolve(okFrame(w.frames[0]["id"], 1)));
}

TEST_CASE("remote errors surface with their device code", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    auto fut = eng.submit("m", json::object(), 2s, w.fn());
    InboundFrame f;
    f.kind = FrameKind::Response;
    f.id = w.frames[0]["id"];
    f.isError = true;
    f.errorCode = "-9";
    f.errorMessage = "denied";
    REQUIRE(eng.resolve(f));
    try {
        fut.get();
        FAIL("expected remote error");
    } catch (const CallError& e) {
        REQUIRE(e.kind() == CallError::Kind::Remote);
        REQUIRE(e.remoteCode() == "-9");
    }
}

TEST_CASE("unknown ids are reported as unmatched", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    REQUIRE_FALSE(eng.resolve(okFrame("nobody", 1)));
}

TEST_CASE("a failing send withdraws the call", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    auto fut = eng.submit("m", json::object(), 2s, [](const std::string&) {
        throw TransportError(TransportError::Kind::Closed, "gone");
    });
    REQUIRE_THROWS_AS(fut.get(), TransportError);
    REQUIRE(eng.pendingCount() == 0);
}

TEST_CASE("params builder sees the correlation id", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    Wire w;
    auto fut = eng.submit("m", [](const std::string& id) { return json{ {"request_id", id} }; }, 2s, w.fn());
    REQUIRE(w.frames[0]["params"]["request_id"] == w.frames[0]["id"]);
    eng.failAll(CallError::Kind::Cancelled, "done");
    REQUIRE_THROWS_AS(fut.get(), CallError);
}

TEST_CASE("concurrent submitters are all resolved", "[correlation]") {
    CorrelationEngine eng(std::make_shared<JsonProtocol>());
    auto send = [&eng](const std::string& frame) {
        auto j = json::parse(frame);
        eng.resolve(okFrame(j["id"], j["params"]["n"]));
    };
    std::vector<std::thread> threads;
    std::atomic_int good{ 0 };
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                int n = t * 100 + i;
                if (eng.submit("m", json{ {"n", n} }, 5s, send).get() == n) ++good;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(good == 200);
}
