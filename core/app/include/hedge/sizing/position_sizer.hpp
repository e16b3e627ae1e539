#pragma once

#include "hedge/config/hedge_config.hpp"
#include "hedge/domain/position.hpp"

namespace hedge {

// -----------------------------------------------------------------------------
// SizingAction — what the sizer wants done next for one side
// -----------------------------------------------------------------------------
enum class ActionKind {
  None,
  OpenInitial,
  ScaleIn,
  CapReached,
};

struct SizingAction {
  ActionKind kind{ActionKind::None};
  int leg_index{0};          // Zero-based; 0 for OpenInitial
  double notional_usd{0.0};  // 0 for None / CapReached
};

// -----------------------------------------------------------------------------
// PositionSizer — tiered leg sizing under a hard notional cap
// -----------------------------------------------------------------------------
//
// @brief  Maps (position, drawdown) to the next action. Pure function of its
//         inputs; holds only a copy of the config.
//
// @details
// Rules, evaluated in order:
//   1. drawdown < trigger_drop_pct                       → None
//   2. legs_filled == 0                                  → OpenInitial(
//        min(usd_position_size, max_usd_position - capacity_used))
//      (CapReached instead if that amount is below min_order_usd)
//   3. scale-in disabled, legs_filled >= scale_in_legs,
//      capacity_used >= max_usd_position, or remaining
//      capacity below min_order_usd                      → CapReached
//   4. drawdown >= trigger + legs_filled * step          → ScaleIn(
//        legs_filled, min(usd_position_size, max_usd_position - capacity_used))
//   5. otherwise                                         → None
//
// scale_in_legs counts every leg of the cycle, the initial one included, so
// scale_in_legs = 3 allows legs 0, 1 and 2.
//
// capacity_used is the side's own notional in per_side cap mode; the caller
// passes the combined exposure of both sides in combined mode.
//
// Threshold comparisons allow 1e-9 of floating-point slack so a drawdown
// computed as 11.999999999 still meets a 12% trigger.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(const HedgeConfig& config);

  SizingAction next_action(const domain::Position& position,
                           double drawdown_pct, double capacity_used) const;

  // Per-side form: capacity_used is the position's own notional.
  SizingAction next_action(const domain::Position& position,
                           double drawdown_pct) const;

  // Drawdown required for the leg with this zero-based index.
  double thresholdForLeg(int leg_index) const;

 private:
  HedgeConfig config_;
};

const char* toString(ActionKind kind);

}  // namespace hedge
