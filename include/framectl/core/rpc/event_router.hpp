/**
 * @file event_router.hpp
 * @brief Classifies inbound control-channel frames and fans them out.
 *
 * Each frame is first copied verbatim to every raw observer, then decoded:
 *  - a response whose id is pending goes to the CorrelationEngine only;
 *  - an event, or a response nobody waits for, goes to the event observers;
 *  - an undecodable frame goes to the malformed-frame observers and the log.
 * route() finishes with one frame before the caller hands it the next.
 */
#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "framectl/core/interfaces/iprotocol.hpp"
#include "framectl/core/rpc/correlation_engine.hpp"
#include "framectl/core/types.hpp"
#include "framectl/core/util/observer_registry.hpp"

namespace framectl {

    /**
     * @struct Event
     * @brief Unsolicited control-channel notification.
     */
    struct Event {
        std::string     name;
        nlohmann::json  data;
        std::string     raw;
    };

    enum class Route { Response, Event, Malformed };

    /**
     * @struct RoutedFrame
     * @brief What route() did with a frame.
     */
    struct RoutedFrame {
        Route           route{ Route::Malformed };
        std::string     event;
        nlohmann::json  data;
    };

    class EventRouter {
    public:
        using RawObserver       = ObserverRegistry<const std::string&>::Callback;
        using EventObserver     = ObserverRegistry<const Event&>::Callback;
        using MalformedObserver = ObserverRegistry<const std::string&, const std::string&>::Callback;

        EventRouter(CorrelationEngine& engine, std::shared_ptr<IProtocol> protocol);

        RoutedFrame route(const std::string& frame);

        HandlerId addRawObserver(RawObserver cb)             { return raw_.add(std::move(cb)); }
        bool removeRawObserver(HandlerId id)                 { return raw_.remove(id); }

        HandlerId addEventObserver(EventObserver cb)         { return events_.add(std::move(cb)); }
        bool removeEventObserver(HandlerId id)               { return events_.remove(id); }

        /// Callback receives the raw frame and the decode failure reason.
        HandlerId addMalformedObserver(MalformedObserver cb) { return malformed_.add(std::move(cb)); }
        bool removeMalformedObserver(HandlerId id)           { return malformed_.remove(id); }

        size_t malformedCount() const { return malformedCount_.load(); }

    private:
        CorrelationEngine&                                      engine_;
        std::shared_ptr<IProtocol>                              protocol_;
        ObserverRegistry<const std::string&>                    raw_;
        ObserverRegistry<const Event&>                          events_;
        ObserverRegistry<const std::string&, const std::string&> malformed_;
        std::atomic<size_t>                                     malformedCount_{ 0 };
    };

}
