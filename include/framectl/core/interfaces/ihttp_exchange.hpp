/**
 * @file ihttp_exchange.hpp
 * @brief One request/response exchange with the companion HTTP surface.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace framectl {

    /// Ordered header list; duplicates allowed.
    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    std::optional<std::string> findHeader(const HttpHeaders& h, const std::string& name);

    struct HttpRequest {
        std::string                 method{ "GET" };
        std::string                 host;
        uint16_t                    port{ 8001 };
        bool                        tls{ false };
        std::string                 target{ "/" };
        HttpHeaders                 headers;
        std::string                 body;
        std::chrono::milliseconds   timeout{ 10000 };

        std::string url() const;
    };

    struct HttpResponse {
        int             status{ 0 };
        HttpHeaders     headers;
        std::string     body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    /**
     * @class IHttpExchange
     * @brief Performs exactly one HTTP exchange; never retries.
     */
    class IHttpExchange {
    public:
        virtual ~IHttpExchange() = default;

        /**
         * @return the response, whatever its status
         * @throws RequestError(Network) if no complete response was received
         */
        virtual HttpResponse perform(const HttpRequest& req) = 0;
    };

}
