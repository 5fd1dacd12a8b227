#pragma once

#include "tradecalc/events/event_types.hpp"

#include <variant>

namespace tradecalc {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus and queued by EventLoopThread.
// Subscribers pick out the alternatives they handle with std::get_if (see
// EventBus::subscribe<EventType>).
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceUpdateEvent,
    QuantityInputEvent,
    ContractsInputEvent,
    MarginInputEvent,
    LeverageInputEvent,
    ChannelStateChangedEvent,
    TradeValuesChangedEvent>;

}  // namespace tradecalc
