/**
 * @file companion_client.hpp
 * @brief Client for the television's HTTP companion surface.
 *
 * Each request() is one independent exchange. Observers see, per request,
 * one RequestStarted followed by exactly one of ResponseReceived (2xx with an
 * acceptable body) or RequestFailed (network error, non-2xx status, or a body
 * rejected by the caller's check). Every failure reaches the caller as a
 * RequestError.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "framectl/core/interfaces/ihttp_exchange.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/types.hpp"
#include "framectl/core/util/observer_registry.hpp"

namespace framectl {

    /**
     * @struct RestEvent
     * @brief Lifecycle notification for one companion request.
     */
    struct RestEvent {
        enum class Kind { RequestStarted, ResponseReceived, RequestFailed };

        Kind                        kind{ Kind::RequestStarted };
        std::string                 requestId;
        std::string                 method;         ///< RequestStarted
        std::string                 url;            ///< RequestStarted
        HttpHeaders                 headers;        ///< request headers, or response headers
        std::string                 body;           ///< request body, or response body
        int                         status{ 0 };    ///< ResponseReceived
        std::chrono::milliseconds   duration{ 0 };  ///< ResponseReceived
        std::string                 message;        ///< RequestFailed
        std::string                 detail;         ///< RequestFailed
    };

    const char* toString(RestEvent::Kind k);

    /**
     * @struct DeviceInfo
     * @brief Parsed GET /api/v2/ document.
     */
    struct DeviceInfo {
        std::string     id;
        std::string     name;
        std::string     modelName;
        bool            frameTvSupport{ false };
        nlohmann::json  raw;
    };

    class CompanionAPIClient {
    public:
        using Observer = ObserverRegistry<const RestEvent&>::Callback;
        /// Inspects a 2xx response before it is reported; throws RequestError(MalformedBody) to reject it.
        using ResponseCheck = std::function<void(const HttpResponse&)>;
        using JsonCheck = std::function<void(const nlohmann::json&)>;

        CompanionAPIClient(std::string host,
                           CompanionOptions opts = {},
                           std::shared_ptr<IHttpExchange> exchange = nullptr);

        /**
         * @brief Perform one request against @p path (e.g. "/api/v2/").
         * @return the 2xx response
         * @throws RequestError(Network), RequestError(Status) or RequestError(MalformedBody)
         */
        HttpResponse request(const std::string& method,
                             const std::string& path,
                             const HttpHeaders& headers = {},
                             const std::string& body = {},
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             const ResponseCheck& check = {});

        /**
         * @brief request() and parse the body as JSON (an empty body yields null).
         *
         * @p check runs on the parsed document before ResponseReceived is emitted.
         * @throws RequestError(MalformedBody) if the body is not JSON or @p check rejects it
         */
        nlohmann::json requestJson(const std::string& method,
                                   const std::string& path,
                                   const nlohmann::json& body = nullptr,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                   const JsonCheck& check = {});

        DeviceInfo deviceInfo();

        HandlerId addObserver(Observer cb)  { return observers_.add(std::move(cb)); }
        bool removeObserver(HandlerId id)   { return observers_.remove(id); }

        const std::string& host() const { return host_; }
        const CompanionOptions& options() const { return opts_; }

    private:
        std::string                         host_;
        CompanionOptions                    opts_;
        std::shared_ptr<IHttpExchange>      exchange_;
        ObserverRegistry<const RestEvent&>  observers_;
    };

    DeviceInfo parseDeviceInfo(const nlohmann::json& j);

}
