/**
 * @file authentication_token.hpp
 * @brief Pairing token issued by a television.
 */
#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "framectl/core/util/time.hpp"

namespace framectl {

    /**
     * @enum TokenScope
     * @brief Operation families a token may be used for.
     */
    enum class TokenScope { RemoteControl, AppManagement, ArtMode, DeviceInfo };

    const char* toString(TokenScope s);
    std::optional<TokenScope> tokenScopeFromString(const std::string& s);

    inline std::set<TokenScope> allScopes() {
        return { TokenScope::RemoteControl, TokenScope::AppManagement,
                 TokenScope::ArtMode, TokenScope::DeviceInfo };
    }

    /**
     * @struct AuthenticationToken
     * @brief Token value bound to the device that issued it.
     *
     * Valid iff the value is non-empty and there is no expiry or now <= expiry.
     */
    struct AuthenticationToken {
        std::string                             value;
        std::string                             deviceId;
        WallClock::time_point                   issuedAt{ WallClock::now() };
        std::optional<WallClock::time_point>    expiresAt;
        std::set<TokenScope>                    scopes{ allScopes() };

        bool isValid(WallClock::time_point now = WallClock::now()) const {
            if (value.empty()) return false;
            return !expiresAt || now <= *expiresAt;
        }

        bool isExpired(WallClock::time_point now = WallClock::now()) const {
            return expiresAt && now > *expiresAt;
        }

        bool permits(TokenScope s) const { return scopes.count(s) != 0; }
    };

    void to_json(nlohmann::json& j, const AuthenticationToken& t);
    void from_json(const nlohmann::json& j, AuthenticationToken& t);

}
