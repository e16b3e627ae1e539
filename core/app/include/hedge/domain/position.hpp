#pragma once

#include "hedge/domain/order.hpp"

#include <optional>
#include <string>

namespace hedge {
namespace domain {

// -----------------------------------------------------------------------------
// HedgeSide — which leg of the hedge a Position belongs to
// -----------------------------------------------------------------------------
enum class HedgeSide {
  Long,   // biased long on symbol_long
  Short,  // biased short on symbol_short
};

// -----------------------------------------------------------------------------
// PositionState — per-side hedge lifecycle
// -----------------------------------------------------------------------------
//
// @details
//   Flat ──OpenInitial──> Entering ──fill──> Entered
//   Entered/Scaling ──ScaleIn──> Scaling(pending) ──fill──> Scaling
//   Entered/Scaling ──CapReached──> Capped
//   any non-flat ──close signal──> Closing ──fill──> Flat
//
// Entering and Closing are transient: an order is in flight. Scaling is
// transient only while Position::pending is set. No new action is computed
// for a side while an order is pending.
// -----------------------------------------------------------------------------
enum class PositionState {
  Flat,
  Entering,
  Entered,
  Scaling,
  Capped,
  Closing,
};

// -----------------------------------------------------------------------------
// Position — one side of the hedge
// -----------------------------------------------------------------------------
//
// @brief  Notional, leg count, and lifecycle state for one hedge side.
//
// @details
// Owned exclusively by HedgeStateMachine. total_notional_usd, legs_filled,
// and avg_entry_price change only on confirmed fills or on restart
// reconciliation, never speculatively when an order is submitted.
//
// halted is set when a terminal collaborator failure (rejected order,
// invalid credentials) stops the side. The state is left where it was; the
// side stays frozen until an operator RESUME or a process restart.
//
// Value type: snapshots are copied into events and status replies.
// -----------------------------------------------------------------------------
struct Position {
  HedgeSide side{HedgeSide::Long};
  std::string symbol;
  double total_notional_usd{0.0};
  int legs_filled{0};
  double avg_entry_price{0.0};
  PositionState state{PositionState::Flat};

  bool halted{false};
  std::string halt_reason;

  std::optional<OrderRequest> pending;  // Outstanding order, if any
  int close_index{0};                   // Close attempts in this cycle
};

// -----------------------------------------------------------------------------
// ExchangePosition — authoritative position reported by the exchange
// -----------------------------------------------------------------------------
// notional_usd is signed: positive = net long, negative = net short.
// -----------------------------------------------------------------------------
struct ExchangePosition {
  std::string symbol;
  double notional_usd{0.0};
  double avg_price{0.0};
};

// Direction used to add exposure on a side.
inline Side entrySide(HedgeSide side) {
  return side == HedgeSide::Long ? Side::Buy : Side::Sell;
}

// Direction used to reduce exposure on a side.
inline Side exitSide(HedgeSide side) {
  return side == HedgeSide::Long ? Side::Sell : Side::Buy;
}

inline const char* toString(HedgeSide s) {
  switch (s) {
    case HedgeSide::Long:  return "LONG";
    case HedgeSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionState s) {
  using S = PositionState;
  switch (s) {
    case S::Flat:     return "FLAT";
    case S::Entering: return "ENTERING";
    case S::Entered:  return "ENTERED";
    case S::Scaling:  return "SCALING";
    case S::Capped:   return "CAPPED";
    case S::Closing:  return "CLOSING";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace hedge
