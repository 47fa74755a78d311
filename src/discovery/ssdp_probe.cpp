#include "framectl/discovery/ssdp_probe.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <functional>

namespace net = boost::asio;
using udp     = boost::asio::ip::udp;

namespace framectl {

    namespace {

        constexpr const char* kMulticastAddr = "239.255.255.250";
        constexpr unsigned short kSsdpPort   = 1900;

        std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
            return s;
        }

        /// "http://192.168.1.20:9197/dmr" -> "192.168.1.20"
        std::string hostOf(std::string_view url) {
            auto p = url.find("://");
            if (p != std::string_view::npos) url.remove_prefix(p + 3);
            auto end = url.find_first_of(":/");
            return std::string(url.substr(0, end));
        }

    }

    std::optional<Device> parseSsdpResponse(std::string_view datagram,
                                            const std::string& sender,
                                            const std::string& searchTarget) {
        std::string location, server, st, usn, friendly;
        bool first = true;
        while (!datagram.empty()) {
            auto eol = datagram.find("\r\n");
            auto line = datagram.substr(0, eol);
            datagram.remove_prefix(eol == std::string_view::npos ? datagram.size() : eol + 2);
            if (first) {
                first = false;
                if (lower(line).rfind("http/1.1 200", 0) != 0 && lower(line).rfind("notify", 0) != 0)
                    return std::nullopt;
                continue;
            }
            auto colon = line.find(':');
            if (colon == std::string_view::npos) continue;
            auto key = lower(trim(line.substr(0, colon)));
            auto value = std::string(trim(line.substr(colon + 1)));
            if (key == "location")                 location = value;
            else if (key == "server")              server = value;
            else if (key == "st" || key == "nt")   st = value;
            else if (key == "usn")                 usn = value;
            else if (key == "x-friendly-name" || key == "friendlyname") friendly = value;
        }

        bool match = (!searchTarget.empty() && (st == searchTarget || usn.find(searchTarget) != std::string::npos))
                  || lower(server).find("samsung") != std::string::npos;
        if (!match) return std::nullopt;

        Device d;
        d.address = location.empty() ? sender : hostOf(location);
        if (d.address.empty()) return std::nullopt;
        d.id = d.address;
        d.name = friendly.empty() ? std::string{ "Samsung TV" } : friendly;
        d.modelName = server;
        d.method = DiscoveryMethod::Ssdp;
        return d;
    }

    std::string SsdpProbe::searchRequest() const {
        return std::format("M-SEARCH * HTTP/1.1\r\n"
                           "HOST: {}:{}\r\n"
                           "MAN: \"ssdp:discover\"\r\n"
                           "MX: {}\r\n"
                           "ST: {}\r\n"
                           "\r\n", kMulticastAddr, kSsdpPort, mx_, searchTarget_);
    }

    void SsdpProbe::run(std::chrono::steady_clock::time_point deadline,
                        std::stop_token stop,
                        const Sink& sink) {
        net::io_context ioc;
        udp::socket sock(ioc);
        boost::system::error_code ec;

        sock.open(udp::v4(), ec);
        if (ec) throw DiscoveryError("cannot open UDP socket: " + ec.message());
        sock.set_option(net::socket_base::reuse_address(true), ec);
        sock.set_option(net::ip::multicast::hops(2), ec);
        if (ec) LOG_DEBUG("ssdp: multicast hops not set: " + ec.message());
        sock.bind(udp::endpoint(udp::v4(), 0), ec);
        if (ec) throw DiscoveryError("cannot bind UDP socket: " + ec.message());

        udp::endpoint group(net::ip::make_address(kMulticastAddr), kSsdpPort);
        auto request = searchRequest();

        auto sendSearch = [&] {
            boost::system::error_code sec;
            sock.send_to(net::buffer(request), group, 0, sec);
            if (sec) LOG_WARN("ssdp: M-SEARCH not sent: " + sec.message());
        };

        std::array<char, 2048> buf{};
        udp::endpoint from;
        std::function<void()> receive = [&] {
            sock.async_receive_from(net::buffer(buf), from, [&](boost::system::error_code rec, std::size_t n) {
                if (rec) return;
                auto sender = from.address().to_string();
                if (auto d = parseSsdpResponse(std::string_view(buf.data(), n), sender, searchTarget_))
                    sink(std::move(*d));
                receive();
            });
        };

        // Resend once after a second; UDP multicast is lossy.
        net::steady_timer resend(ioc);
        resend.expires_after(std::chrono::seconds(1));
        resend.async_wait([&](boost::system::error_code tec) { if (!tec) sendSearch(); });

        sendSearch();
        receive();

        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            auto slice = std::min<std::chrono::steady_clock::duration>(
                std::chrono::milliseconds(100), deadline - std::chrono::steady_clock::now());
            ioc.run_for(slice);
            if (ioc.stopped()) ioc.restart();
        }
        sock.close(ec);
        resend.cancel();
        ioc.restart();
        ioc.poll();
    }

}
