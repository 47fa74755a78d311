/**
 * @file websocket_transport.cpp
 * @brief Boost.Beast implementation of the control-channel transport.
 */
#include "framectl/transports/websocket/websocket_transport.hpp"
#include "framectl/core/util/logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = boost::asio::ssl;
using tcp           = boost::asio::ip::tcp;

namespace framectl {

    namespace {

        using WsStream  = websocket::stream<beast::tcp_stream>;
        using WssStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

        enum class Stage { Resolve, Connect, Tls, Upgrade, Done };

        using DoneFn = std::function<void(beast::error_code, Stage)>;

        std::exception_ptr errorFor(Stage stage, const beast::error_code& ec, const Endpoint& ep) {
            auto where = std::format("{}:{}", ep.host, ep.port);
            if (ec == beast::error::timeout)
                return std::make_exception_ptr(TransportError(TransportError::Kind::Timeout,
                    std::format("{} timed out: {}", where, ec.message())));
            switch (stage) {
            case Stage::Resolve:
            case Stage::Connect:
                return std::make_exception_ptr(TransportError(TransportError::Kind::Refused,
                    std::format("cannot reach {}: {}", where, ec.message())));
            case Stage::Tls:
                return std::make_exception_ptr(HandshakeError(
                    std::format("TLS handshake with {} failed: {}", where, ec.message())));
            default:
                return std::make_exception_ptr(HandshakeError(
                    std::format("WebSocket upgrade with {} failed: {}", where, ec.message())));
            }
        }

        /// Inbound frames plus the way the stream ended; shared by io thread and reader.
        struct Inbox {
            std::mutex                      mx;
            std::condition_variable         cv;
            std::deque<std::string>         frames;
            bool                            ended{ false };
            std::optional<TransportError>   error;

            void push(std::string f) {
                {
                    std::lock_guard lk(mx);
                    frames.push_back(std::move(f));
                }
                cv.notify_one();
            }

            void end(std::optional<TransportError> e) {
                {
                    std::lock_guard lk(mx);
                    if (ended) return;
                    ended = true;
                    error = std::move(e);
                }
                cv.notify_all();
            }
        };

        class Link {
        public:
            virtual ~Link() = default;
            virtual void start(const tcp::resolver::results_type& results, const Endpoint& ep,
                               std::chrono::milliseconds timeout, DoneFn done) = 0;
            virtual void startReading() = 0;
            virtual void write(std::string frame, std::shared_ptr<std::promise<void>> p) = 0;
            virtual void shutdown() = 0;
        };

        template <class WS>
        class WsLink : public Link {
            static constexpr bool kTls = std::is_same_v<WS, WssStream>;
        public:
            template <class... Extra>
            WsLink(const WebSocketOptions& opts, Inbox& inbox, net::io_context& ioc, Extra&... extra)
                : opts_(opts), inbox_(inbox), ws_(ioc, extra...), graceTimer_(ioc) {}

            void start(const tcp::resolver::results_type& results, const Endpoint& ep,
                       std::chrono::milliseconds timeout, DoneFn done) override {
                host_ = std::format("{}:{}", ep.host, ep.port);
                sni_ = ep.host;
                target_ = ep.target;
                timeout_ = timeout;
                done_ = std::move(done);

                beast::get_lowest_layer(ws_).expires_after(timeout);
                beast::get_lowest_layer(ws_).async_connect(results,
                    [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        if (ec) return done_(ec, Stage::Connect);
                        if constexpr (kTls) {
                            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), sni_.c_str())) {
                                beast::error_code sniEc{ static_cast<int>(::ERR_get_error()),
                                                         net::error::get_ssl_category() };
                                return done_(sniEc, Stage::Tls);
                            }
                            ws_.next_layer().async_handshake(ssl::stream_base::client,
                                [this](beast::error_code ec) {
                                    if (ec) return done_(ec, Stage::Tls);
                                    upgrade();
                                });
                        } else {
                            upgrade();
                        }
                    });
            }

            void startReading() override {
                ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
                    if (ec) {
                        if (ec == websocket::error::closed || closing_)
                            inbox_.end(std::nullopt);
                        else
                            inbox_.end(TransportError(TransportError::Kind::Disconnected,
                                                      std::format("{}: {}", host_, ec.message())));
                        return;
                    }
                    inbox_.push(beast::buffers_to_string(buffer_.data()));
                    buffer_.consume(buffer_.size());
                    startReading();
                });
            }

            void write(std::string frame, std::shared_ptr<std::promise<void>> p) override {
                if (closing_) {
                    p->set_exception(std::make_exception_ptr(
                        TransportError(TransportError::Kind::Closed, "transport is closing")));
                    return;
                }
                outbox_.emplace_back(std::move(frame), std::move(p));
                if (outbox_.size() == 1) writeNext();
            }

            void shutdown() override {
                closing_ = true;
                bool busy = !outbox_.empty();
                failOutbox();
                if (!ws_.is_open() || busy) {
                    closeSocket();
                    return;
                }
                graceTimer_.expires_after(opts_.closeGrace);
                graceTimer_.async_wait([this](beast::error_code ec) {
                    if (ec != net::error::operation_aborted) closeSocket();
                });
                ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
                    if (ec) LOG_DEBUG(std::format("close handshake with {}: {}", host_, ec.message()));
                    graceTimer_.cancel();
                    closeSocket();
                });
            }

        private:
            void upgrade() {
                beast::get_lowest_layer(ws_).expires_never();

                websocket::stream_base::timeout to{};
                to.handshake_timeout = timeout_;
                to.idle_timeout = websocket::stream_base::none();
                to.keep_alive_pings = false;
                ws_.set_option(to);

                auto ua = opts_.userAgent;
                ws_.set_option(websocket::stream_base::decorator(
                    [ua](websocket::request_type& req) {
                        req.set(beast::http::field::user_agent, ua);
                    }));
                ws_.read_message_max(opts_.maxFrameBytes);

                ws_.async_handshake(host_, target_, [this](beast::error_code ec) {
                    done_(ec, ec ? Stage::Upgrade : Stage::Done);
                });
            }

            void writeNext() {
                ws_.text(true);
                ws_.async_write(net::buffer(outbox_.front().first),
                    [this](beast::error_code ec, std::size_t) {
                        if (outbox_.empty()) return;   // failed by shutdown()
                        auto p = std::move(outbox_.front().second);
                        outbox_.pop_front();
                        if (ec)
                            p->set_exception(std::make_exception_ptr(TransportError(
                                TransportError::Kind::Disconnected,
                                std::format("write to {} failed: {}", host_, ec.message()))));
                        else
                            p->set_value();
                        if (!outbox_.empty()) writeNext();
                    });
            }

            void failOutbox() {
                for (auto& [frame, p] : outbox_)
                    p->set_exception(std::make_exception_ptr(
                        TransportError(TransportError::Kind::Closed, "transport closed before the frame was written")));
                outbox_.clear();
            }

            void closeSocket() {
                beast::error_code ec;
                beast::get_lowest_layer(ws_).socket().close(ec);
                if (ec) LOG_DEBUG(std::format("closing socket to {}: {}", host_, ec.message()));
            }

            const WebSocketOptions&     opts_;
            Inbox&                      inbox_;
            WS                          ws_;
            net::steady_timer           graceTimer_;
            beast::flat_buffer          buffer_;
            std::string                 host_, sni_, target_;
            std::chrono::milliseconds   timeout_{ 0 };
            DoneFn                      done_;
            std::deque<std::pair<std::string, std::shared_ptr<std::promise<void>>>> outbox_;
            bool                        closing_{ false };
        };

    }

    class WebSocketTransport::Impl {
    public:
        explicit Impl(WebSocketOptions o)
            : opts(std::move(o)), tls(ssl::context::tlsv12_client), resolver(ioc)
        {
            tls.set_verify_mode(ssl::verify_none);
        }

        WebSocketOptions                opts;
        net::io_context                 ioc;
        ssl::context                    tls;
        tcp::resolver                   resolver;
        std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
        std::unique_ptr<Link>           link;
        Inbox                           inbox;
        std::jthread                    io;
        std::atomic_bool                connected{ false };
        std::atomic_bool                closed{ false };
    };

    WebSocketTransport::WebSocketTransport(WebSocketOptions opts)
        : pImpl_(std::make_unique<Impl>(std::move(opts))) {}

    WebSocketTransport::~WebSocketTransport() {
        close();
    }

    TransportFactory WebSocketTransport::factory(WebSocketOptions opts) {
        return [opts]() -> std::unique_ptr<ITransport> {
            return std::make_unique<WebSocketTransport>(opts);
        };
    }

    void WebSocketTransport::connect(const Endpoint& ep, std::chrono::milliseconds timeout) {
        auto& d = *pImpl_;
        if (d.closed) throw TransportError(TransportError::Kind::Closed, "transport already closed");
        if (d.link) throw std::logic_error("WebSocketTransport::connect called twice");

        if (ep.security == SecurityMode::Tls)
            d.link = std::make_unique<WsLink<WssStream>>(d.opts, d.inbox, d.ioc, d.tls);
        else
            d.link = std::make_unique<WsLink<WsStream>>(d.opts, d.inbox, d.ioc);

        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();

        d.work.emplace(net::make_work_guard(d.ioc));
        d.io = std::jthread([&d] { d.ioc.run(); });

        net::post(d.ioc, [&d, ep, timeout, done] {
            d.resolver.async_resolve(ep.host, std::to_string(ep.port),
                [&d, ep, timeout, done](beast::error_code ec, tcp::resolver::results_type results) {
                    if (ec) {
                        done->set_exception(errorFor(Stage::Resolve, ec, ep));
                        return;
                    }
                    d.link->start(results, ep, timeout, [&d, ep, done](beast::error_code ec, Stage stage) {
                        if (ec) {
                            done->set_exception(errorFor(stage, ec, ep));
                            return;
                        }
                        d.link->startReading();
                        done->set_value();
                    });
                });
        });

        if (fut.wait_for(timeout + std::chrono::milliseconds(500)) != std::future_status::ready) {
            close();
            throw TransportError(TransportError::Kind::Timeout,
                                 std::format("connect to {}:{} timed out after {}ms", ep.host, ep.port, timeout.count()));
        }
        try {
            fut.get();
        } catch (const std::exception& e) {
            bool wasClosed = d.closed;
            close();
            if (wasClosed)
                throw TransportError(TransportError::Kind::Closed, std::format("closed while connecting: {}", e.what()));
            throw;
        }
        d.connected = true;
        LOG_DEBUG(std::format("channel to {}:{} open", ep.host, ep.port));
    }

    void WebSocketTransport::send(const std::string& frame) {
        auto& d = *pImpl_;
        if (d.closed) throw TransportError(TransportError::Kind::Closed, "send on closed transport");
        if (!d.connected) throw TransportError(TransportError::Kind::Closed, "send before connect");
        {
            std::lock_guard lk(d.inbox.mx);
            if (d.inbox.ended)
                throw TransportError(TransportError::Kind::Disconnected, "send on a dropped channel");
        }

        auto p = std::make_shared<std::promise<void>>();
        auto f = p->get_future();
        net::post(d.ioc, [&d, frame, p]() mutable { d.link->write(std::move(frame), std::move(p)); });

        while (f.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (d.closed) throw TransportError(TransportError::Kind::Closed, "transport closed during send");
        }
        try {
            f.get();
        } catch (const std::future_error&) {
            throw TransportError(TransportError::Kind::Closed, "transport closed before the frame was written");
        }
    }

    std::optional<std::string> WebSocketTransport::receive() {
        auto& in = pImpl_->inbox;
        std::unique_lock lk(in.mx);
        in.cv.wait(lk, [&in] { return !in.frames.empty() || in.ended; });
        if (in.frames.empty()) return std::nullopt;
        auto f = std::move(in.frames.front());
        in.frames.pop_front();
        return f;
    }

    void WebSocketTransport::close() {
        auto& d = *pImpl_;
        if (d.closed.exchange(true)) return;

        if (d.io.joinable()) {
            net::post(d.ioc, [&d] {
                d.resolver.cancel();
                if (d.link) d.link->shutdown();
            });
            d.work.reset();
            if (d.io.get_id() != std::this_thread::get_id()) d.io.join();
        }
        d.inbox.end(std::nullopt);
    }

    std::optional<TransportError> WebSocketTransport::lastError() const {
        std::lock_guard lk(pImpl_->inbox.mx);
        return pImpl_->inbox.error;
    }

}
