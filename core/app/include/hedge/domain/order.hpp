#pragma once

#include <cstdint>
#include <string>

namespace hedge {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the direction of an order sent to the exchange.
// A long hedge side opens with Buy and closes with Sell; a short hedge side
// does the opposite.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderPurpose
// -----------------------------------------------------------------------------
// Responsibility: Records which state machine transition produced an order.
//   Open    — initial leg of a cycle (FLAT → ENTERING)
//   ScaleIn — additional leg (ENTERED/SCALING → SCALING pending)
//   Close   — external close signal (any non-flat state → CLOSING)
// Close orders reduce an existing position and never open a new one.
// -----------------------------------------------------------------------------
enum class OrderPurpose {
  Open,
  ScaleIn,
  Close,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: One logical order, notional-denominated, with a stable
// idempotency key.
//
// @details
// The key is derived deterministically from (symbol, purpose, index, anchor
// epoch) by makeIdempotencyKey(). Every retry of the same logical action
// reuses the same OrderRequest, so the exchange sees the same key and can
// deduplicate. The request lives only as long as the action is outstanding;
// it is never persisted.
//
// leg_index is the zero-based leg number for Open/ScaleIn (the initial leg is
// 0) and the zero-based close attempt for Close.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string idempotency_key;
  std::string symbol;
  Side side{Side::Buy};
  double notional_usd{0.0};
  int leg_index{0};
  OrderPurpose purpose{OrderPurpose::Open};
  std::uint64_t anchor_epoch{0};
};

// -----------------------------------------------------------------------------
// OrderStatus — fill outcome reported by the exchange
// -----------------------------------------------------------------------------
// Rejections are not a status: they are reported as a CollaboratorError with
// ErrorCode::Rejected so that the caller cannot mistake one for a fill.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Filled,
  PartiallyFilled,
};

// -----------------------------------------------------------------------------
// OrderResult
// -----------------------------------------------------------------------------
// Responsibility: Confirmed execution of an OrderRequest.
//
// filled_notional_usd is expressed in the same units as the request: entry
// notional for Open/ScaleIn, and the entry notional released for Close.
// -----------------------------------------------------------------------------
struct OrderResult {
  std::string idempotency_key;
  double filled_notional_usd{0.0};
  double avg_price{0.0};
  OrderStatus status{OrderStatus::Filled};
};

// -------------------------------------------------------------------------
// makeIdempotencyKey
// -------------------------------------------------------------------------
// @brief  Builds the stable key for one logical order.
//
// @return "<symbol>-L<index>-E<epoch>" for Open/ScaleIn,
//         "<symbol>-C<index>-E<epoch>" for Close.
//
// @details
// The anchor epoch is the TriggerTracker's freeze stamp for the current
// cycle, so keys from different cycles (and from before a restart) never
// collide.
// -------------------------------------------------------------------------
inline std::string makeIdempotencyKey(const std::string& symbol,
                                      OrderPurpose purpose, int index,
                                      std::uint64_t epoch) {
  const char* kind = (purpose == OrderPurpose::Close) ? "-C" : "-L";
  return symbol + kind + std::to_string(index) + "-E" + std::to_string(epoch);
}

inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

inline const char* toString(OrderPurpose p) {
  switch (p) {
    case OrderPurpose::Open:    return "Open";
    case OrderPurpose::ScaleIn: return "ScaleIn";
    case OrderPurpose::Close:   return "Close";
  }
  return "Unknown";
}

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace hedge
