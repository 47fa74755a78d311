#include "framectl/core/rpc/event_router.hpp"
#include "framectl/core/util/logger.hpp"
#include <format>

namespace framectl {

    EventRouter::EventRouter(CorrelationEngine& engine, std::shared_ptr<IProtocol> protocol)
        : engine_(engine), protocol_(std::move(protocol)) {}

    RoutedFrame EventRouter::route(const std::string& frame) {
        raw_.notify(frame);

        auto in = protocol_->parse(frame);
        RoutedFrame out;

        if (in.kind == FrameKind::Malformed) {
            ++malformedCount_;
            LOG_WARN(std::format("protocol error: {} ({} bytes)", in.parseError, frame.size()));
            malformed_.notify(frame, in.parseError);
            out.route = Route::Malformed;
            return out;
        }

        if (in.kind == FrameKind::Response && engine_.resolve(in)) {
            out.route = Route::Response;
            out.event = in.event;
            return out;
        }

        Event ev;
        ev.name = in.event.empty() ? std::string{ "response" } : in.event;
        ev.data = in.payload;
        ev.raw = frame;
        if (in.kind == FrameKind::Response)
            LOG_DEBUG(std::format("response for unknown id {} forwarded as event", in.id));

        out.route = Route::Event;
        out.event = ev.name;
        out.data = ev.data;
        events_.notify(ev);
        return out;
    }

}
