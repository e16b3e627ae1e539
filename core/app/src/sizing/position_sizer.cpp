#include "hedge/sizing/position_sizer.hpp"

#include <algorithm>

namespace hedge {

namespace {

constexpr double kEpsilon = 1e-9;

SizingAction capReached() { return SizingAction{ActionKind::CapReached, 0, 0.0}; }

}  // namespace

PositionSizer::PositionSizer(const HedgeConfig& config) : config_(config) {}

double PositionSizer::thresholdForLeg(int leg_index) const {
  return config_.trigger_drop_pct + leg_index * config_.scale_in_drop_step;
}

// -----------------------------------------------------------------------------
// next_action(): rules 1-5
// -----------------------------------------------------------------------------
SizingAction PositionSizer::next_action(const domain::Position& position,
                                        double drawdown_pct,
                                        double capacity_used) const {
  // Rule 1: below the trigger nothing ever happens.
  if (drawdown_pct + kEpsilon < config_.trigger_drop_pct) {
    return SizingAction{};
  }

  const double remaining = config_.max_usd_position - capacity_used;
  const double min_order = std::max(config_.min_order_usd, kEpsilon);

  // Rule 2: initial leg.
  if (position.legs_filled == 0) {
    double notional = std::min(config_.usd_position_size, remaining);
    if (notional < min_order) {
      return capReached();
    }
    return SizingAction{ActionKind::OpenInitial, 0, notional};
  }

  // Rule 3: cap.
  if (!config_.enable_scale_in ||
      position.legs_filled >= config_.scale_in_legs ||
      capacity_used >= config_.max_usd_position - kEpsilon ||
      remaining < min_order) {
    return capReached();
  }

  // Rule 4: next tier.
  if (drawdown_pct + kEpsilon >= thresholdForLeg(position.legs_filled)) {
    double notional = std::min(config_.usd_position_size, remaining);
    return SizingAction{ActionKind::ScaleIn, position.legs_filled, notional};
  }

  // Rule 5.
  return SizingAction{};
}

SizingAction PositionSizer::next_action(const domain::Position& position,
                                        double drawdown_pct) const {
  return next_action(position, drawdown_pct, position.total_notional_usd);
}

const char* toString(ActionKind kind) {
  switch (kind) {
    case ActionKind::None:        return "None";
    case ActionKind::OpenInitial: return "OpenInitial";
    case ActionKind::ScaleIn:     return "ScaleIn";
    case ActionKind::CapReached:  return "CapReached";
  }
  return "Unknown";
}

}  // namespace hedge
