#pragma once

#include "hedge/domain/collaborator_error.hpp"
#include "hedge/domain/order.hpp"
#include "hedge/domain/position.hpp"

#include <cstdint>
#include <string>

namespace hedge {

// -----------------------------------------------------------------------------
// Hedge events
// -----------------------------------------------------------------------------
// Plain-data records published on the EventBus by HedgeStateMachine and
// ControlLoop. Every field is copied in, so an event stays valid after
// publication regardless of what the publisher does next. Subscribers are
// the console logger in main() and the IpcServer telemetry bridge.
//
// Thread model: created and published on the control loop thread. Safe to
// copy across threads.
// -----------------------------------------------------------------------------

// One drawdown reading for one side (published every tick the price is read).
struct PriceObservedEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  std::string symbol;
  double price{0.0};         // Trigger price (mark price, or ratio)
  double anchor_price{0.0};
  double drawdown_pct{0.0};
  std::int64_t timestamp_ms{0};
};

// An OrderRequest was handed to the exchange (first attempt or re-placement).
struct OrderSubmittedEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  domain::OrderRequest request;
  std::int64_t timestamp_ms{0};
};

// A confirmed fill was applied to the Position.
struct OrderFilledEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  domain::OrderRequest request;
  domain::OrderResult result;
  std::int64_t timestamp_ms{0};
};

struct StateTransitionEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  std::string symbol;
  domain::PositionState from{domain::PositionState::Flat};
  domain::PositionState to{domain::PositionState::Flat};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// Published once per cap-hit, not on every tick spent at the cap.
struct CapReachedEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  std::string symbol;
  double total_notional_usd{0.0};
  int legs_filled{0};
  std::int64_t timestamp_ms{0};
};

// A terminal failure stopped one side. The other side keeps running.
struct SideHaltedEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  std::string symbol;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// Snapshot of a Position after any change to its notional or state.
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ReconciliationMismatchEvent
// -----------------------------------------------------------------------------
// In-memory Position disagreed with the exchange during reconciliation. The
// exchange value has already replaced the in-memory one when this is
// published; the event exists so the discrepancy is surfaced, not hidden.
// -----------------------------------------------------------------------------
struct ReconciliationMismatchEvent {
  domain::HedgeSide side{domain::HedgeSide::Long};
  std::string symbol;
  double memory_notional_usd{0.0};
  double exchange_notional_usd{0.0};
  std::string detail;
  std::int64_t timestamp_ms{0};
};

// A collaborator call failed. will_retry is false when the failure was
// terminal or the per-tick retry budget is exhausted.
struct CollaboratorFailureEvent {
  std::string operation;  // "get_mark_price", "place_order", ...
  std::string target;     // Symbol or idempotency key
  domain::CollaboratorError error;
  int attempt{0};
  bool will_retry{false};
  std::int64_t timestamp_ms{0};
};

}  // namespace hedge
