#include <catch2/catch_all.hpp>
#include "framectl/core/auth/auth_store.hpp"
#include "framectl/core/auth/memory_token_store.hpp"
#include "framectl/core/util/error_types.hpp"

using namespace framectl;
using namespace std::chrono_literals;

namespace {
    AuthenticationToken token(const std::string& device, const std::string& value = "12345") {
        AuthenticationToken t;
        t.value = value;
        t.deviceId = device;
        return t;
    }
}

TEST_CASE("token validity follows its expiry", "[auth]") {
    auto t = token("tv");
    REQUIRE(t.isValid());
    REQUIRE_FALSE(t.isExpired());

    t.expiresAt = WallClock::now() - 1s;
    REQUIRE_FALSE(t.isValid());
    REQUIRE(t.isExpired());

    AuthenticationToken empty;
    REQUIRE_FALSE(empty.isValid());
}

TEST_CASE("tokens carry every scope by default", "[auth]") {
    auto t = token("tv");
    for (auto s : allScopes()) REQUIRE(t.permits(s));
}

TEST_CASE("token JSON keeps value, device, expiry and scopes", "[auth]") {
    auto t = token("tv");
    t.expiresAt = fromEpochMillis(toEpochMillis(WallClock::now()) + 60000);
    t.scopes = { TokenScope::RemoteControl };
    nlohmann::json j = t;
    auto back = j.get<AuthenticationToken>();
    REQUIRE(back.value == t.value);
    REQUIRE(back.deviceId == "tv");
    REQUIRE(back.expiresAt.has_value());
    REQUIRE(back.scopes == t.scopes);
}

TEST_CASE("stored token for this device is presented", "[auth]") {
    auto store = std::make_shared<MemoryTokenStore>(token("tv"));
    AuthStore auth("tv", store);
    auto p = auth.presentable();
    REQUIRE(p);
    REQUIRE(p->value == "12345");
}

TEST_CASE("expired stored token is dropped and removed", "[auth]") {
    auto t = token("tv");
    t.expiresAt = WallClock::now() - 1s;
    auto store = std::make_shared<MemoryTokenStore>(t);
    AuthStore auth("tv", store);
    REQUIRE_FALSE(auth.presentable());
    REQUIRE_FALSE(store->load());
}

TEST_CASE("token of another device is never presented", "[auth]") {
    auto store = std::make_shared<MemoryTokenStore>(token("other"));
    AuthStore auth("tv", store);
    REQUIRE_FALSE(auth.presentable());
    REQUIRE_THROWS_AS(auth.accept(token("other")), AuthenticationError);
}

TEST_CASE("issued tokens are saved through the store", "[auth]") {
    auto store = std::make_shared<MemoryTokenStore>();
    AuthStore auth("tv", store);
    auth.acceptIssued("999");
    REQUIRE(store->saveCount() == 1);
    REQUIRE(store->load()->value == "999");
    REQUIRE(auth.current()->deviceId == "tv");
}

TEST_CASE("scope checks", "[auth]") {
    AuthStore auth("tv");
    REQUIRE_NOTHROW(auth.requireScope(TokenScope::ArtMode));

    auto t = token("tv");
    t.scopes = { TokenScope::RemoteControl };
    auth.accept(t);
    REQUIRE_NOTHROW(auth.requireScope(TokenScope::RemoteControl));
    try {
        auth.requireScope(TokenScope::ArtMode);
        FAIL("expected scope error");
    } catch (const AuthenticationError& e) {
        REQUIRE(e.kind() == AuthenticationError::Kind::ScopeInsufficient);
    }
}

TEST_CASE("clear forgets the token everywhere", "[auth]") {
    auto store = std::make_shared<MemoryTokenStore>(token("tv"));
    AuthStore auth("tv", store);
    REQUIRE(auth.presentable());
    auth.clear();
    REQUIRE_FALSE(auth.current());
    REQUIRE_FALSE(store->load());
}
