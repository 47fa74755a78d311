/**
 * @file iprotocol.hpp
 * @brief Interface for control-channel frame encoding.
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace framectl {

    /**
     * @enum FrameKind
     * @brief Shape of an inbound frame, before correlation.
     */
    enum class FrameKind {
        Response,   ///< carries a correlation id
        Event,      ///< unsolicited notification
        Malformed   ///< not parseable / unrecognised shape
    };

    /**
     * @struct InboundFrame
     * @brief Decoded inbound frame.
     *
     * For a Response, exactly one of ok / isError holds unless the payload
     * is unusable, in which case both are false.
     */
    struct InboundFrame {
        FrameKind       kind{ FrameKind::Malformed };
        std::string     id;             ///< correlation id (Response)
        std::string     event;          ///< event name (Event), or the wrapping event of a Response
        bool            ok{ false };
        bool            isError{ false };
        nlohmann::json  payload;        ///< result, or event data
        std::string     errorCode;
        std::string     errorMessage;
        std::string     parseError;     ///< reason (Malformed)
    };

    /**
     * @class IProtocol
     * @brief Encodes outbound calls and decodes inbound frames.
     */
    class IProtocol {
    public:
        virtual ~IProtocol() = default;
        virtual std::string serializeCall(const std::string& method,
                                          const nlohmann::json& params,
                                          const std::string& id) = 0;
        virtual InboundFrame parse(const std::string& frame) = 0;
    };

}
