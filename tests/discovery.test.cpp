#include <catch2/catch_all.hpp>
#include <atomic>
#include <thread>
#include "framectl/core/util/error_types.hpp"
#include "framectl/discovery/discovery_engine.hpp"
#include "framectl/discovery/ssdp_probe.hpp"
#include "mock_http_exchange.hpp"

using namespace framectl;
using namespace framectl::test;
using namespace std::chrono_literals;

namespace {
    Device at(const std::string& address, const std::string& name = "TV") {
        Device d;
        d.id = address;
        d.address = address;
        d.name = name;
        return d;
    }

    // Emits its devices after an initial delay, then idles until stopped or the deadline.
    class FakeProbe : public IDiscoveryProbe {
    public:
        FakeProbe(DiscoveryMethod m, std::vector<Device> devices, std::chrono::milliseconds delay = 0ms,
                  bool unavailable = false)
            : method_(m), devices_(std::move(devices)), delay_(delay), unavailable_(unavailable) {}

        DiscoveryMethod method() const override { return method_; }

        void run(std::chrono::steady_clock::time_point deadline, std::stop_token stop, const Sink& sink) override {
            ++runs;
            if (unavailable_) throw DiscoveryError("no daemon");
            std::this_thread::sleep_for(delay_);
            for (auto const& d : devices_) {
                if (stop.stop_requested()) break;
                sink(d);
            }
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(5ms);
            if (stop.stop_requested()) stopped = true;
            // a result arriving after cancellation must be dropped
            if (!devices_.empty()) sink(at("10.9.9.9", "late"));
        }

        std::atomic_int runs{ 0 };
        std::atomic_bool stopped{ false };

    private:
        DiscoveryMethod             method_;
        std::vector<Device>         devices_;
        std::chrono::milliseconds   delay_;
        bool                        unavailable_;
    };
}

TEST_CASE("results from both probes are merged and de-duplicated", "[discovery]") {
    auto mdns = std::make_shared<FakeProbe>(DiscoveryMethod::Mdns, std::vector{ at("10.0.0.2", "Frame") });
    auto ssdp = std::make_shared<FakeProbe>(DiscoveryMethod::Ssdp,
                                            std::vector{ at("10.0.0.2", "Frame (ssdp)"), at("10.0.0.3") }, 40ms);
    DiscoveryEngine engine({}, { mdns, ssdp });

    auto results = engine.discover(300ms).collect();
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].device.address == "10.0.0.2");
    REQUIRE(results[0].method == DiscoveryMethod::Mdns);
    REQUIRE(results[0].device.name == "Frame");
    REQUIRE(results[1].device.address == "10.0.0.3");
    REQUIRE(results[1].method == DiscoveryMethod::Ssdp);
}

TEST_CASE("an unavailable probe does not stop the other", "[discovery]") {
    auto mdns = std::make_shared<FakeProbe>(DiscoveryMethod::Mdns, std::vector<Device>{}, 0ms, true);
    auto ssdp = std::make_shared<FakeProbe>(DiscoveryMethod::Ssdp, std::vector{ at("10.0.0.7") });
    DiscoveryEngine engine({}, { mdns, ssdp });

    auto results = engine.discover(150ms).collect();
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].method == DiscoveryMethod::Ssdp);
}

TEST_CASE("stream ends at the deadline", "[discovery]") {
    auto p = std::make_shared<FakeProbe>(DiscoveryMethod::Ssdp, std::vector<Device>{});
    DiscoveryEngine engine({}, { p });
    auto start = std::chrono::steady_clock::now();
    auto results = engine.discover(120ms).collect();
    REQUIRE(results.empty());
    auto took = std::chrono::steady_clock::now() - start;
    REQUIRE(took >= 100ms);
    REQUIRE(took < 1s);
}

TEST_CASE("cancel stops the probes and yields nothing further", "[discovery]") {
    auto p = std::make_shared<FakeProbe>(DiscoveryMethod::Mdns, std::vector{ at("10.0.0.2") });
    DiscoveryEngine engine({}, { p });

    auto stream = engine.discover(5s);
    auto first = stream.next();
    REQUIRE(first);

    auto start = std::chrono::steady_clock::now();
    stream.cancel();
    REQUIRE_FALSE(stream.next());
    REQUIRE(std::chrono::steady_clock::now() - start < 500ms);

    auto until = std::chrono::steady_clock::now() + 1s;
    while (!p->stopped && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(5ms);
    REQUIRE(p->stopped);
}

TEST_CASE("only one discovery at a time, restart after it ends", "[discovery]") {
    auto p = std::make_shared<FakeProbe>(DiscoveryMethod::Ssdp, std::vector{ at("10.0.0.4") });
    DiscoveryEngine engine({}, { p });

    auto s1 = engine.discover(100ms);
    REQUIRE_THROWS_AS(engine.discover(100ms), std::logic_error);
    REQUIRE(s1.collect().size() == 1);

    auto s2 = engine.discover(100ms);
    REQUIRE(s2.collect().size() == 1);
    REQUIRE(p->runs == 2);

    engine.discover(5s);
    engine.cancel();
    REQUIRE_NOTHROW(engine.discover(50ms).collect());
}

TEST_CASE("find queries device info and reports a manual result", "[discovery]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, R"({"device":{"name":"Bedroom","modelName":"QE32LS03C"}})");
    DiscoveryEngine engine({}, { std::make_shared<FakeProbe>(DiscoveryMethod::Ssdp, std::vector<Device>{}) }, http);

    auto r = engine.find("10.0.0.9");
    REQUIRE(r.method == DiscoveryMethod::Manual);
    REQUIRE(r.device.address == "10.0.0.9");
    REQUIRE(r.device.name == "Bedroom");
    REQUIRE(http->lastRequest().target == "/api/v2/");

    http->handler = MockHttpExchange::unreachable();
    REQUIRE_THROWS_AS(engine.find("10.0.0.10"), RequestError);
}

TEST_CASE("SSDP responses from Samsung devices are recognised", "[discovery][ssdp]") {
    const std::string st = "urn:samsung.com:device:RemoteControlReceiver:1";
    std::string reply =
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "LOCATION: http://192.168.1.20:9197/dmr\r\n"
        "SERVER: SHP, UPnP/1.0, Samsung UPnP SDK/1.0\r\n"
        "ST: urn:samsung.com:device:RemoteControlReceiver:1\r\n"
        "USN: uuid:0ee6b4a4::urn:samsung.com:device:RemoteControlReceiver:1\r\n"
        "\r\n";
    auto d = parseSsdpResponse(reply, "192.168.1.99", st);
    REQUIRE(d);
    REQUIRE(d->address == "192.168.1.20");
    REQUIRE(d->method == DiscoveryMethod::Ssdp);

    std::string other =
        "HTTP/1.1 200 OK\r\n"
        "SERVER: Linux UPnP/1.0 Sonos/70.3\r\n"
        "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
        "\r\n";
    REQUIRE_FALSE(parseSsdpResponse(other, "192.168.1.30", st));
    REQUIRE_FALSE(parseSsdpResponse("M-SEARCH * HTTP/1.1\r\n\r\n", "192.168.1.30", st));

    std::string noLocation =
        "HTTP/1.1 200 OK\r\n"
        "SERVER: Samsung/1.0\r\n"
        "\r\n";
    auto d2 = parseSsdpResponse(noLocation, "192.168.1.21", st);
    REQUIRE(d2);
    REQUIRE(d2->address == "192.168.1.21");
}

TEST_CASE("M-SEARCH request names the target and MX", "[discovery][ssdp]") {
    SsdpProbe probe("urn:samsung.com:device:RemoteControlReceiver:1", 2);
    auto req = probe.searchRequest();
    REQUIRE(req.starts_with("M-SEARCH * HTTP/1.1\r\n"));
    REQUIRE(req.find("HOST: 239.255.255.250:1900\r\n") != std::string::npos);
    REQUIRE(req.find("MAN: \"ssdp:discover\"\r\n") != std::string::npos);
    REQUIRE(req.find("MX: 2\r\n") != std::string::npos);
    REQUIRE(req.ends_with("\r\n\r\n"));
}
