/**
 * @file beast_http_exchange.hpp
 * @brief IHttpExchange implemented with Boost.Beast, one connection per request.
 */
#pragma once
#include <cstddef>
#include <string>
#include "framectl/core/interfaces/ihttp_exchange.hpp"

namespace framectl {

    class BeastHttpExchange : public IHttpExchange {
    public:
        explicit BeastHttpExchange(std::string userAgent = "framectl",
                                   std::size_t bodyLimit = 32 * 1024 * 1024)
            : userAgent_(std::move(userAgent)), bodyLimit_(bodyLimit) {}

        HttpResponse perform(const HttpRequest& req) override;

    private:
        std::string userAgent_;
        std::size_t bodyLimit_;
    };

}
