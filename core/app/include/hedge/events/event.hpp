#pragma once

#include "hedge/events/hedge_events.hpp"

#include <variant>

namespace hedge {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by the EventBus. A std::variant keeps
// value semantics (no heap, no base-class pointers) and lets subscribers
// dispatch with std::get_if or std::visit. Adding an event kind means adding
// it here; visitors that must be exhaustive fail to compile until updated.
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceObservedEvent,
    OrderSubmittedEvent,
    OrderFilledEvent,
    StateTransitionEvent,
    CapReachedEvent,
    SideHaltedEvent,
    PositionUpdateEvent,
    ReconciliationMismatchEvent,
    CollaboratorFailureEvent>;

}  // namespace hedge
