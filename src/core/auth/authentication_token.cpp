#include "framectl/core/auth/authentication_token.hpp"
#include <nlohmann/json.hpp>

namespace framectl {

    const char* toString(TokenScope s) {
        switch (s) {
        case TokenScope::RemoteControl: return "remoteControl";
        case TokenScope::AppManagement: return "appManagement";
        case TokenScope::ArtMode:       return "artMode";
        case TokenScope::DeviceInfo:    return "deviceInfo";
        }
        return "unknown";
    }

    std::optional<TokenScope> tokenScopeFromString(const std::string& s) {
        for (auto sc : allScopes())
            if (s == toString(sc)) return sc;
        return std::nullopt;
    }

    void to_json(nlohmann::json& j, const AuthenticationToken& t) {
        j = nlohmann::json{
            {"value", t.value},
            {"deviceId", t.deviceId},
            {"issuedAt", toEpochMillis(t.issuedAt)},
        };
        j["expiresAt"] = t.expiresAt ? nlohmann::json(toEpochMillis(*t.expiresAt)) : nlohmann::json(nullptr);
        auto& sc = j["scopes"] = nlohmann::json::array();
        for (auto s : t.scopes) sc.push_back(toString(s));
    }

    void from_json(const nlohmann::json& j, AuthenticationToken& t) {
        t.value    = j.at("value").get<std::string>();
        t.deviceId = j.at("deviceId").get<std::string>();
        t.issuedAt = fromEpochMillis(j.value<std::uint64_t>("issuedAt", epochMillis()));
        t.expiresAt.reset();
        if (auto it = j.find("expiresAt"); it != j.end() && it->is_number())
            t.expiresAt = fromEpochMillis(it->get<std::uint64_t>());
        if (auto it = j.find("scopes"); it != j.end() && it->is_array()) {
            t.scopes.clear();
            for (auto const& s : *it)
                if (auto sc = tokenScopeFromString(s.get<std::string>())) t.scopes.insert(*sc);
        } else {
            t.scopes = allScopes();
        }
    }

}
