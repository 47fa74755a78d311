#include "framectl/core/protocol/json_protocol.hpp"

namespace framectl {

    namespace {

        std::string idString(const nlohmann::json& v) {
            if (v.is_string()) return v.get<std::string>();
            if (v.is_number_integer()) return std::to_string(v.get<long long>());
            return {};
        }

        std::string scalarString(const nlohmann::json& v) {
            if (v.is_string()) return v.get<std::string>();
            if (v.is_null()) return {};
            return v.dump();
        }

        void decodeError(const nlohmann::json& e, InboundFrame& f) {
            f.isError = true;
            if (e.is_object()) {
                if (auto it = e.find("code"); it != e.end()) f.errorCode = scalarString(*it);
                if (auto it = e.find("message"); it != e.end()) f.errorMessage = scalarString(*it);
            } else {
                f.errorMessage = scalarString(e);
            }
            if (f.errorMessage.empty()) f.errorMessage = "device reported an error";
            f.payload = e;
        }

        /// d2d_service_message: the payload is a JSON document serialized into "data".
        bool decodeWrapped(const nlohmann::json& data, InboundFrame& f) {
            nlohmann::json inner = data;
            if (data.is_string()) {
                inner = nlohmann::json::parse(data.get<std::string>(), nullptr, false);
                if (inner.is_discarded()) return false;
            }
            if (!inner.is_object()) return false;

            std::string id;
            if (auto it = inner.find("request_id"); it != inner.end()) id = idString(*it);
            if (id.empty())
                if (auto it = inner.find("id"); it != inner.end()) id = idString(*it);
            if (id.empty()) return false;

            f.kind = FrameKind::Response;
            f.id = id;
            if (inner.value("event", std::string{}) == "error") {
                f.isError = true;
                f.errorCode = inner.contains("error_code") ? scalarString(inner["error_code"]) : std::string{};
                f.errorMessage = inner.contains("error_text") ? scalarString(inner["error_text"])
                               : inner.contains("error")      ? scalarString(inner["error"])
                                                              : std::string{ "device reported an error" };
                f.payload = inner;
            } else {
                f.ok = true;
                f.payload = inner;
            }
            return true;
        }

    }

    std::string JsonProtocol::serializeCall(const std::string& method,
                                            const nlohmann::json& params,
                                            const std::string& id) {
        nlohmann::json j{
            {"method", method},
            {"params", params.is_null() ? nlohmann::json::object() : params},
            {"id", id},
        };
        return j.dump();
    }

    InboundFrame JsonProtocol::parse(const std::string& frame) {
        InboundFrame f;
        auto j = nlohmann::json::parse(frame, nullptr, false);
        if (j.is_discarded()) {
            f.parseError = "invalid JSON";
            return f;
        }
        if (!j.is_object()) {
            f.parseError = "frame is not a JSON object";
            return f;
        }

        auto ev = j.find("event");
        if (ev != j.end() && ev->is_string()) {
            f.event = ev->get<std::string>();
            auto data = j.find("data");
            if (f.event == "d2d_service_message" && data != j.end() && decodeWrapped(*data, f))
                return f;
            f.kind = FrameKind::Event;
            f.payload = data != j.end() ? *data : nlohmann::json(nullptr);
            return f;
        }

        if (auto id = j.find("id"); id != j.end()) {
            f.id = idString(*id);
            if (f.id.empty()) {
                f.parseError = "id must be a string or integer";
                return f;
            }
            f.kind = FrameKind::Response;
            if (auto r = j.find("result"); r != j.end()) {
                f.ok = true;
                f.payload = *r;
            } else if (auto e = j.find("error"); e != j.end()) {
                decodeError(*e, f);
            } else {
                f.parseError = "response carries neither result nor error";
            }
            return f;
        }

        if (auto m = j.find("method"); m != j.end() && m->is_string()) {
            f.kind = FrameKind::Event;
            f.event = m->get<std::string>();
            f.payload = j.value("params", nlohmann::json(nullptr));
            return f;
        }

        f.parseError = "frame has no id, event or method";
        return f;
    }

}
