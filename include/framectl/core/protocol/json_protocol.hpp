/**
 * @file json_protocol.hpp
 * @brief JSON text frames of the TV control channel.
 *
 * Outbound:  {"method": m, "params": p, "id": id}
 * Response:  {"id": id, "result": r} or {"id": id, "error": e}
 * Event:     {"event": name, "data": d, ...}
 *
 * d2d_service_message events whose data (a JSON string or object) carries an
 * "id" or "request_id" are decoded as Responses; an inner "event":"error"
 * marks a device-reported failure.
 */
#pragma once
#include "framectl/core/interfaces/iprotocol.hpp"

namespace framectl {

    class JsonProtocol : public IProtocol {
    public:
        std::string serializeCall(const std::string& method,
                                  const nlohmann::json& params,
                                  const std::string& id) override;
        InboundFrame parse(const std::string& frame) override;
    };

}
