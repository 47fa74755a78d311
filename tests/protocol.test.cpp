#include <catch2/catch_all.hpp>
#include "framectl/core/protocol/json_protocol.hpp"

using namespace framectl;
using nlohmann::json;

TEST_CASE("serializeCall produces method, params and id", "[protocol]") {
    JsonProtocol p;
    auto j = json::parse(p.serializeCall("ms.remote.control", { {"Cmd", "Click"} }, "abc-1"));
    REQUIRE(j["method"] == "ms.remote.control");
    REQUIRE(j["params"]["Cmd"] == "Click");
    REQUIRE(j["id"] == "abc-1");
}

TEST_CASE("null params serialize as an empty object", "[protocol]") {
    JsonProtocol p;
    auto j = json::parse(p.serializeCall("x", nullptr, "1"));
    REQUIRE(j["params"].is_object());
    REQUIRE(j["params"].empty());
}

TEST_CASE("event frames are classified by their event field", "[protocol]") {
    JsonProtocol p;
    auto f = p.parse(R"({"event":"ms.channel.connect","data":{"token":"123"}})");
    REQUIRE(f.kind == FrameKind::Event);
    REQUIRE(f.event == "ms.channel.connect");
    REQUIRE(f.payload["token"] == "123");
}

TEST_CASE("result and error responses carry their id", "[protocol]") {
    JsonProtocol p;

    auto ok = p.parse(R"({"id":"a-1","result":{"value":"on"}})");
    REQUIRE(ok.kind == FrameKind::Response);
    REQUIRE(ok.id == "a-1");
    REQUIRE(ok.ok);
    REQUIRE(ok.payload["value"] == "on");

    auto err = p.parse(R"({"id":7,"error":{"code":-1,"message":"nope"}})");
    REQUIRE(err.kind == FrameKind::Response);
    REQUIRE(err.id == "7");
    REQUIRE(err.isError);
    REQUIRE(err.errorCode == "-1");
    REQUIRE(err.errorMessage == "nope");
}

TEST_CASE("d2d_service_message is unwrapped into a response", "[protocol]") {
    JsonProtocol p;
    json inner{ {"event", "artmode_status"}, {"value", "on"}, {"request_id", "r-9"} };
    auto f = p.parse(json{ {"event", "d2d_service_message"}, {"data", inner.dump()} }.dump());
    REQUIRE(f.kind == FrameKind::Response);
    REQUIRE(f.id == "r-9");
    REQUIRE(f.ok);
    REQUIRE(f.payload["value"] == "on");
    REQUIRE(f.event == "d2d_service_message");
}

TEST_CASE("d2d error event becomes a remote error", "[protocol]") {
    JsonProtocol p;
    json inner{ {"event", "error"}, {"id", "r-2"}, {"error_code", "-7"}, {"error_text", "bad content id"} };
    auto f = p.parse(json{ {"event", "d2d_service_message"}, {"data", inner.dump()} }.dump());
    REQUIRE(f.kind == FrameKind::Response);
    REQUIRE(f.isError);
    REQUIRE(f.errorCode == "-7");
    REQUIRE(f.errorMessage == "bad content id");
}

TEST_CASE("d2d message without an id stays an event", "[protocol]") {
    JsonProtocol p;
    json inner{ {"event", "image_selected"}, {"content_id", "MY_F0001"} };
    auto f = p.parse(json{ {"event", "d2d_service_message"}, {"data", inner.dump()} }.dump());
    REQUIRE(f.kind == FrameKind::Event);
    REQUIRE(f.event == "d2d_service_message");
}

TEST_CASE("unparseable or unrecognised frames are malformed", "[protocol]") {
    JsonProtocol p;
    REQUIRE(p.parse("{not json").kind == FrameKind::Malformed);
    REQUIRE(p.parse("[1,2,3]").kind == FrameKind::Malformed);
    REQUIRE(p.parse(R"({"foo":1})").kind == FrameKind::Malformed);
    REQUIRE(p.parse(R"({"id":{"x":1},"result":1})").kind == FrameKind::Malformed);
    REQUIRE_FALSE(p.parse("{not json").parseError.empty());
}

TEST_CASE("response without result or error reports a parse error", "[protocol]") {
    JsonProtocol p;
    auto f = p.parse(R"({"id":"z"})");
    REQUIRE(f.kind == FrameKind::Response);
    REQUIRE_FALSE(f.ok);
    REQUIRE_FALSE(f.isError);
    REQUIRE_FALSE(f.parseError.empty());
}
