#include "framectl/core/options.hpp"
#include "framectl/core/strategies/linear_backoff.hpp"
#include "framectl/core/util/error_types.hpp"
#include <nlohmann/json.hpp>
#include <format>
#include <utility>

namespace framectl {

    namespace {

        template <typename T>
        void read(const nlohmann::json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw ValidationError(std::format("option '{}': {}", key, e.what()));
            }
        }

        /// Integers go through a wide type first so negative or oversized values are rejected instead of wrapping.
        template <typename T>
        void readInt(const nlohmann::json& j, const char* key, T& out) {
            long long v = out;
            read(j, key, v);
            if (!std::in_range<T>(v))
                throw ValidationError(std::format("option '{}' is out of range: {}", key, v));
            out = static_cast<T>(v);
        }

        void readMs(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
            long long ms = out.count();
            read(j, key, ms);
            if (ms < 0) throw ValidationError(std::format("option '{}' must not be negative", key));
            out = std::chrono::milliseconds(ms);
        }

        const nlohmann::json& section(const nlohmann::json& j, const char* key) {
            static const nlohmann::json empty = nlohmann::json::object();
            auto it = j.find(key);
            if (it == j.end()) return empty;
            if (!it->is_object()) throw ValidationError(std::format("option section '{}' must be an object", key));
            return *it;
        }

        std::shared_ptr<IBackoffStrategy> backoffFrom(const nlohmann::json& j) {
            std::string type = "exponential";
            std::chrono::milliseconds base{ 1000 }, max{ 30000 };
            read(j, "type", type);
            readMs(j, "baseMs", base);
            readMs(j, "maxMs", max);
            if (type == "linear")      return std::make_shared<LinearBackoff>(base, max);
            if (type == "exponential") return std::make_shared<ExponentialBackoff>(base, max);
            throw ValidationError("unknown backoff type: " + type);
        }

    }

    ClientOptions ClientOptions::fromJson(const nlohmann::json& j) {
        if (!j.is_object()) throw ValidationError("options document must be a JSON object");
        ClientOptions o;

        auto const& s = section(j, "session");
        read(s, "clientName", o.session.clientName);
        readInt(s, "port", o.session.port);
        read(s, "channel", o.session.channel);
        if (s.contains("security")) {
            std::string v;
            read(s, "security", v);
            if (v == "tls")        o.session.security = SecurityMode::Tls;
            else if (v == "plain") o.session.security = SecurityMode::Plain;
            else throw ValidationError("session.security must be 'tls' or 'plain'");
        }
        readMs(s, "handshakeTimeoutMs", o.session.handshakeTimeout);
        readMs(s, "callTimeoutMs", o.session.callTimeout);

        auto const& r = section(s, "reconnect");
        read(r, "enabled", o.session.reconnect.enabled);
        readInt(r, "maxAttempts", o.session.reconnect.maxAttempts);
        if (r.contains("backoff")) o.session.reconnect.backoff = backoffFrom(section(r, "backoff"));

        auto const& h = section(s, "healthCheck");
        read(h, "enabled", o.session.healthCheck.enabled);
        readMs(h, "intervalMs", o.session.healthCheck.interval);
        readMs(h, "timeoutMs", o.session.healthCheck.timeout);
        if (o.session.healthCheck.enabled && o.session.healthCheck.interval.count() == 0)
            throw ValidationError("option 'healthCheck.intervalMs' must be positive");

        auto const& c = section(j, "companion");
        readInt(c, "port", o.companion.port);
        read(c, "tls", o.companion.tls);
        readMs(c, "requestTimeoutMs", o.companion.requestTimeout);

        auto const& d = section(j, "discovery");
        read(d, "mdnsServiceType", o.discovery.mdnsServiceType);
        read(d, "ssdpSearchTarget", o.discovery.ssdpSearchTarget);
        readInt(d, "mx", o.discovery.mx);
        if (o.discovery.mx < 1 || o.discovery.mx > 5) throw ValidationError("option 'mx' must be between 1 and 5");

        auto const& rm = section(j, "remote");
        readMs(rm, "keyDelayMs", o.remote.keyDelay);
        read(rm, "awaitAck", o.remote.awaitAck);

        auto const& ct = section(j, "content");
        readMs(ct, "artTimeoutMs", o.content.artTimeout);
        readMs(ct, "uploadTimeoutMs", o.content.uploadTimeout);

        return o;
    }

}
