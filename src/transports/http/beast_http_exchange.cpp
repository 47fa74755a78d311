#include "framectl/transports/http/beast_http_exchange.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace framectl {

    std::optional<std::string> findHeader(const HttpHeaders& h, const std::string& name) {
        auto eq = [](const std::string& a, const std::string& b) {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
        };
        for (auto const& [k, v] : h)
            if (eq(k, name)) return v;
        return std::nullopt;
    }

    std::string HttpRequest::url() const {
        return std::format("{}://{}:{}{}", tls ? "https" : "http", host, port, target);
    }

    namespace {

        RequestError networkError(const HttpRequest& req, const char* what, const beast::error_code& ec) {
            return RequestError(RequestError::Kind::Network,
                                std::format("{} {}: {} failed: {}", req.method, req.url(), what, ec.message()));
        }

        /// Runs write + read on an already connected (and, for TLS, handshaken) stream.
        template <class Stream>
        HttpResponse exchange(net::io_context& ioc, Stream& stream, const HttpRequest& req,
                              http::request<http::string_body>& msg, std::size_t bodyLimit) {
            beast::error_code ec;
            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.body_limit(bodyLimit);

            http::async_write(stream, msg, [&](beast::error_code wec, std::size_t) {
                if (wec) { ec = wec; return; }
                http::async_read(stream, buffer, parser, [&](beast::error_code rec, std::size_t) { ec = rec; });
            });
            ioc.restart();
            ioc.run();
            if (ec) throw networkError(req, "exchange", ec);

            auto& res = parser.get();
            HttpResponse out;
            out.status = static_cast<int>(res.result_int());
            for (auto const& f : res)
                out.headers.emplace_back(std::string(f.name_string()), std::string(f.value()));
            out.body = std::move(res.body());
            return out;
        }

    }

    HttpResponse BeastHttpExchange::perform(const HttpRequest& req) {
        auto verb = http::string_to_verb(req.method);
        if (verb == http::verb::unknown)
            throw ValidationError("unsupported HTTP method: " + req.method);

        http::request<http::string_body> msg{ verb, req.target, 11 };
        msg.set(http::field::host, std::format("{}:{}", req.host, req.port));
        msg.set(http::field::user_agent, userAgent_);
        for (auto const& [k, v] : req.headers) msg.set(k, v);
        msg.body() = req.body;
        msg.prepare_payload();

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::error_code ec;
        auto results = resolver.resolve(req.host, std::to_string(req.port), ec);
        if (ec) throw networkError(req, "resolve", ec);

        if (!req.tls) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(req.timeout);
            stream.async_connect(results, [&](beast::error_code cec, tcp::endpoint) { ec = cec; });
            ioc.run();
            if (ec) throw networkError(req, "connect", ec);

            auto res = exchange(ioc, stream, req, msg, bodyLimit_);
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected)
                LOG_DEBUG(std::format("shutdown {}: {}", req.url(), ec.message()));
            return res;
        }

        ssl::context ctx(ssl::context::tlsv12_client);
        ctx.set_verify_mode(ssl::verify_none);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), req.host.c_str()))
            throw RequestError(RequestError::Kind::Network, "cannot set TLS SNI for " + req.host);

        beast::get_lowest_layer(stream).expires_after(req.timeout);
        beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code cec, tcp::endpoint) {
            if (cec) { ec = cec; return; }
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code hec) { ec = hec; });
        });
        ioc.run();
        if (ec) throw networkError(req, "TLS connect", ec);

        auto res = exchange(ioc, stream, req, msg, bodyLimit_);
        beast::get_lowest_layer(stream).close();
        return res;
    }

}
