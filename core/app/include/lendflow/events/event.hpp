#pragma once

#include "lendflow/events/conversation_events.hpp"

#include <variant>

namespace lendflow {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. Dispatch with std::get_if or
// EventBus::subscribe<T>(); adding a type here is enough for the bus to
// carry it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    StageTransitionEvent,
    UnderwritingDecisionEvent,
    SafeguardTripEvent,
    ConversationClosedEvent>;

}  // namespace lendflow
