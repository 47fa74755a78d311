#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include "framectl/core/util/time.hpp"
#include "framectl/transports/http/beast_http_exchange.hpp"
#include "internal/core/util/random.hpp"
#include <format>

namespace framectl {

    const char* toString(RestEvent::Kind k) {
        switch (k) {
        case RestEvent::Kind::RequestStarted:   return "request-started";
        case RestEvent::Kind::ResponseReceived: return "response-received";
        case RestEvent::Kind::RequestFailed:    return "request-failed";
        }
        return "unknown";
    }

    CompanionAPIClient::CompanionAPIClient(std::string host,
                                           CompanionOptions opts,
                                           std::shared_ptr<IHttpExchange> exchange)
        : host_(std::move(host)),
          opts_(std::move(opts)),
          exchange_(exchange ? std::move(exchange) : std::make_shared<BeastHttpExchange>()) {}

    HttpResponse CompanionAPIClient::request(const std::string& method,
                                             const std::string& path,
                                             const HttpHeaders& headers,
                                             const std::string& body,
                                             std::optional<std::chrono::milliseconds> timeout,
                                             const ResponseCheck& check) {
        HttpRequest req;
        req.method = method;
        req.host = host_;
        req.port = opts_.port;
        req.tls = opts_.tls;
        req.target = path;
        req.headers = headers;
        req.body = body;
        req.timeout = timeout.value_or(opts_.requestTimeout);

        RestEvent started;
        started.kind = RestEvent::Kind::RequestStarted;
        started.requestId = randomUuid();
        started.method = method;
        started.url = req.url();
        started.headers = headers;
        started.body = body;
        observers_.notify(started);
        LOG_DEBUG(std::format("rest {} {} {}", started.requestId, method, started.url));

        auto fail = [&](const std::string& message, const std::string& detail) {
            RestEvent ev;
            ev.kind = RestEvent::Kind::RequestFailed;
            ev.requestId = started.requestId;
            ev.message = message;
            ev.detail = detail;
            observers_.notify(ev);
        };

        auto t0 = SteadyClock::now();
        HttpResponse res;
        try {
            res = exchange_->perform(req);
        } catch (const RequestError& e) {
            LOG_WARN(std::format("rest {} failed: {}", started.requestId, e.what()));
            fail("network error", e.what());
            throw;
        } catch (const std::exception& e) {
            LOG_WARN(std::format("rest {} not sent: {}", started.requestId, e.what()));
            fail("request not sent", e.what());
            throw RequestError(RequestError::Kind::Network,
                               std::format("{} {} not sent: {}", method, path, e.what()));
        }
        auto took = elapsedSince(t0);

        if (!res.ok()) {
            auto msg = std::format("{} {} returned HTTP {}", method, path, res.status);
            LOG_WARN(std::format("rest {}: {}", started.requestId, msg));
            fail(msg, res.body);
            throw RequestError(RequestError::Kind::Status, msg, res.status);
        }

        if (check) {
            try {
                check(res);
            } catch (const RequestError& e) {
                LOG_WARN(std::format("rest {}: {}", started.requestId, e.what()));
                fail(e.what(), res.body);
                throw;
            } catch (const std::exception& e) {
                LOG_WARN(std::format("rest {}: {}", started.requestId, e.what()));
                fail(e.what(), res.body);
                throw RequestError(RequestError::Kind::MalformedBody,
                                   std::format("{} {}: {}", method, path, e.what()), res.status);
            }
        }

        RestEvent done;
        done.kind = RestEvent::Kind::ResponseReceived;
        done.requestId = started.requestId;
        done.status = res.status;
        done.headers = res.headers;
        done.body = res.body;
        done.duration = took;
        observers_.notify(done);
        LOG_DEBUG(std::format("rest {} -> {} in {}ms", started.requestId, res.status, took.count()));
        return res;
    }

    nlohmann::json CompanionAPIClient::requestJson(const std::string& method,
                                                   const std::string& path,
                                                   const nlohmann::json& body,
                                                   std::optional<std::chrono::milliseconds> timeout,
                                                   const JsonCheck& check) {
        HttpHeaders headers{ { "Accept", "application/json" } };
        std::string payload;
        if (!body.is_null()) {
            headers.emplace_back("Content-Type", "application/json");
            payload = body.dump();
        }
        nlohmann::json j;
        request(method, path, headers, payload, timeout, [&](const HttpResponse& res) {
            if (res.body.empty()) {
                j = nullptr;
            } else {
                j = nlohmann::json::parse(res.body, nullptr, false);
                if (j.is_discarded())
                    throw RequestError(RequestError::Kind::MalformedBody,
                                       std::format("{} {}: response is not JSON", method, path), res.status);
            }
            if (check) check(j);
        });
        return j;
    }

    DeviceInfo parseDeviceInfo(const nlohmann::json& j) {
        if (!j.is_object())
            throw RequestError(RequestError::Kind::MalformedBody, "device info is not a JSON object");
        DeviceInfo info;
        info.raw = j;
        auto const& dev = j.contains("device") && j["device"].is_object() ? j["device"] : j;
        auto str = [](const nlohmann::json& o, const char* k) {
            auto it = o.find(k);
            return it != o.end() && it->is_string() ? it->get<std::string>() : std::string{};
        };
        info.id = str(dev, "id");
        if (info.id.empty()) info.id = str(j, "id");
        info.name = str(dev, "name");
        if (info.name.empty()) info.name = str(j, "name");
        info.modelName = str(dev, "modelName");
        if (auto it = dev.find("FrameTVSupport"); it != dev.end())
            info.frameTvSupport = it->is_boolean() ? it->get<bool>() : (it->is_string() && it->get<std::string>() == "true");
        return info;
    }

    DeviceInfo CompanionAPIClient::deviceInfo() {
        DeviceInfo info;
        requestJson("GET", "/api/v2/", nullptr, std::nullopt,
                    [&](const nlohmann::json& j) { info = parseDeviceInfo(j); });
        return info;
    }

}
