#include <catch2/catch_all.hpp>
#include <vector>
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/util/error_types.hpp"
#include "mock_http_exchange.hpp"

using namespace framectl;
using namespace framectl::test;

namespace {
    struct Recorder {
        std::vector<RestEvent> events;
        CompanionAPIClient::Observer fn() {
            return [this](const RestEvent& e) { events.push_back(e); };
        }
        std::vector<RestEvent::Kind> kinds() const {
            std::vector<RestEvent::Kind> k;
            for (auto const& e : events) k.push_back(e.kind);
            return k;
        }
    };
}

TEST_CASE("successful request emits started then received", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, R"({"ok":true})");
    CompanionAPIClient c("192.168.1.20", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());

    auto res = c.request("GET", "/api/v2/");
    REQUIRE(res.status == 200);
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::ResponseReceived });
    REQUIRE(rec.events[0].url == "http://192.168.1.20:8001/api/v2/");
    REQUIRE(rec.events[0].method == "GET");
    REQUIRE(rec.events[1].requestId == rec.events[0].requestId);
    REQUIRE(rec.events[1].body == R"({"ok":true})");
}

TEST_CASE("non-2xx emits request-failed and never response-received", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(404, "not found");
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());

    try {
        c.request("POST", "/api/v2/applications/111299001912");
        FAIL("expected status error");
    } catch (const RequestError& e) {
        REQUIRE(e.kind() == RequestError::Kind::Status);
        REQUIRE(e.status() == 404);
    }
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::RequestFailed });
    REQUIRE(rec.events[1].detail == "not found");
}

TEST_CASE("network failure emits request-failed", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::unreachable();
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());

    REQUIRE_THROWS_AS(c.request("GET", "/api/v2/"), RequestError);
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::RequestFailed });
}

TEST_CASE("removed REST observer is not notified", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    auto id = c.addObserver(rec.fn());
    REQUIRE(c.removeObserver(id));
    c.request("GET", "/api/v2/");
    REQUIRE(rec.events.empty());
}

TEST_CASE("requestJson sends a JSON body and parses the reply", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, R"({"a":1})");
    CompanionAPIClient c("tv", {}, http);

    auto j = c.requestJson("POST", "/x", { {"show", true} });
    REQUIRE(j["a"] == 1);
    auto req = http->lastRequest();
    REQUIRE(req.body == R"({"show":true})");
    REQUIRE(findHeader(req.headers, "Content-Type") == "application/json");
}

TEST_CASE("non-JSON body is a malformed-body error", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, "<html>");
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());
    try {
        c.requestJson("GET", "/api/v2/");
        FAIL("expected malformed body");
    } catch (const RequestError& e) {
        REQUIRE(e.kind() == RequestError::Kind::MalformedBody);
    }
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::RequestFailed });
    REQUIRE(rec.events[1].detail == "<html>");
}

TEST_CASE("rejected JSON document emits request-failed", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, R"(["not","an","object"])");
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());

    try {
        c.deviceInfo();
        FAIL("expected malformed body");
    } catch (const RequestError& e) {
        REQUIRE(e.kind() == RequestError::Kind::MalformedBody);
    }
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::RequestFailed });
}

TEST_CASE("exchange errors other than RequestError surface as network errors", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = [](const HttpRequest&) -> HttpResponse {
        throw ValidationError("unsupported HTTP method 'BREW'");
    };
    CompanionAPIClient c("tv", {}, http);
    Recorder rec;
    c.addObserver(rec.fn());

    try {
        c.request("BREW", "/api/v2/");
        FAIL("expected network error");
    } catch (const RequestError& e) {
        REQUIRE(e.kind() == RequestError::Kind::Network);
    }
    REQUIRE(rec.kinds() == std::vector{ RestEvent::Kind::RequestStarted, RestEvent::Kind::RequestFailed });
}

TEST_CASE("device info is parsed from the device object", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    http->handler = MockHttpExchange::respond(200, R"({
        "id":"uuid:abc","name":"[TV] Samsung Frame",
        "device":{"id":"uuid:abc","name":"Living Room","modelName":"QE55LS03B","FrameTVSupport":"true"}
    })");
    CompanionAPIClient c("tv", {}, http);
    auto info = c.deviceInfo();
    REQUIRE(info.id == "uuid:abc");
    REQUIRE(info.name == "Living Room");
    REQUIRE(info.modelName == "QE55LS03B");
    REQUIRE(info.frameTvSupport);
}

TEST_CASE("companion TLS and timeout options reach the exchange", "[rest]") {
    auto http = std::make_shared<MockHttpExchange>();
    CompanionOptions o;
    o.tls = true;
    o.port = 8002;
    o.requestTimeout = std::chrono::milliseconds(1234);
    CompanionAPIClient c("tv", o, http);
    c.request("GET", "/api/v2/");
    auto req = http->lastRequest();
    REQUIRE(req.tls);
    REQUIRE(req.port == 8002);
    REQUIRE(req.timeout == std::chrono::milliseconds(1234));
    REQUIRE(req.url() == "https://tv:8002/api/v2/");
}
