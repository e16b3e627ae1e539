#include "hedge/state/hedge_state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace hedge {

using domain::HedgeSide;
using domain::OrderPurpose;
using domain::OrderRequest;
using domain::OrderResult;
using domain::Position;
using domain::PositionState;

namespace {

constexpr double kEpsilon = 1e-9;
constexpr int kMaxRestoredLegs = 1'000'000;

std::size_t indexOf(HedgeSide side) {
  return side == HedgeSide::Long ? 0 : 1;
}

HedgeSide otherSide(HedgeSide side) {
  return side == HedgeSide::Long ? HedgeSide::Short : HedgeSide::Long;
}

}  // namespace

HedgeStateMachine::HedgeStateMachine(const HedgeConfig& config,
                                     TriggerTracker& tracker, EventBus& bus)
    : config_(config), tracker_(tracker), bus_(bus), sizer_(config) {
  sides_[0].position.side = HedgeSide::Long;
  sides_[0].position.symbol = config_.symbol_long;
  sides_[1].position.side = HedgeSide::Short;
  sides_[1].position.symbol = config_.symbol_short;
}

HedgeStateMachine::SideState& HedgeStateMachine::sideState(HedgeSide side) {
  return sides_[indexOf(side)];
}

const HedgeStateMachine::SideState& HedgeStateMachine::sideState(
    HedgeSide side) const {
  return sides_[indexOf(side)];
}

const Position& HedgeStateMachine::position(HedgeSide side) const {
  return sideState(side).position;
}

bool HedgeStateMachine::wasIssued(const std::string& key) const {
  return issued_keys_.count(key) > 0;
}

// -----------------------------------------------------------------------------
// capacityUsed(): own notional, or both sides plus in-flight entries
// -----------------------------------------------------------------------------
double HedgeStateMachine::capacityUsed(HedgeSide side) const {
  if (config_.cap_mode == CapMode::PerSide) {
    return position(side).total_notional_usd;
  }

  double used = 0.0;
  for (const SideState& s : sides_) {
    used += s.position.total_notional_usd;
    const auto& pending = s.position.pending;
    if (pending && pending->purpose != OrderPurpose::Close) {
      used += pending->notional_usd;
    }
  }
  return used;
}

// -----------------------------------------------------------------------------
// onPrice(): observe → gate → size → transition
// -----------------------------------------------------------------------------
std::optional<OrderRequest> HedgeStateMachine::onPrice(HedgeSide side,
                                                       double price,
                                                       std::int64_t now_ms) {
  SideState& state = sideState(side);
  Position& pos = state.position;

  DrawdownReading reading = tracker_.observe(pos.symbol, price, now_ms);

  PriceObservedEvent observed;
  observed.side = side;
  observed.symbol = pos.symbol;
  observed.price = price;
  observed.anchor_price = reading.anchor_price;
  observed.drawdown_pct = reading.pct;
  observed.timestamp_ms = now_ms;
  bus_.publish(observed);

  if (pos.halted || pos.pending || pos.state == PositionState::Capped ||
      pos.state == PositionState::Closing) {
    return std::nullopt;
  }

  const double used = capacityUsed(side);
  SizingAction action = sizer_.next_action(pos, reading.pct, used);

  if (action.kind == ActionKind::CapReached &&
      config_.cap_mode == CapMode::Combined) {
    // Room taken only by the other side's unconfirmed entry may come back
    // if that order fails; wait for it instead of capping.
    const auto& other = sideState(otherSide(side)).position.pending;
    if (other && other->purpose != OrderPurpose::Close) {
      SizingAction confirmed =
          sizer_.next_action(pos, reading.pct, used - other->notional_usd);
      if (confirmed.kind != ActionKind::CapReached) {
        return std::nullopt;
      }
    }
  }

  switch (action.kind) {
    case ActionKind::None:
      return std::nullopt;

    case ActionKind::OpenInitial: {
      std::uint64_t epoch = tracker_.freeze(pos.symbol, now_ms);
      OrderRequest request = makeRequest(pos, OrderPurpose::Open, 0,
                                         action.notional_usd, epoch);
      if (!issued_keys_.insert(request.idempotency_key).second) {
        std::cerr << "[HedgeStateMachine] refusing to re-issue "
                  << request.idempotency_key << "\n";
        return std::nullopt;
      }
      state.cap_notified = false;
      pos.pending = request;
      transition(pos, PositionState::Entering,
                 "drawdown " + std::to_string(reading.pct) + "%", now_ms);
      return request;
    }

    case ActionKind::ScaleIn: {
      std::uint64_t epoch = currentEpoch(pos, now_ms);
      OrderRequest request =
          makeRequest(pos, OrderPurpose::ScaleIn, action.leg_index,
                      action.notional_usd, epoch);
      if (!issued_keys_.insert(request.idempotency_key).second) {
        std::cerr << "[HedgeStateMachine] refusing to re-issue "
                  << request.idempotency_key << "\n";
        return std::nullopt;
      }
      pos.pending = request;
      transition(pos, PositionState::Scaling,
                 "scale-in leg " + std::to_string(action.leg_index) +
                     " at drawdown " + std::to_string(reading.pct) + "%",
                 now_ms);
      return request;
    }

    case ActionKind::CapReached:
      if (pos.state == PositionState::Entered ||
          pos.state == PositionState::Scaling) {
        transition(pos, PositionState::Capped, "cap reached", now_ms);
        publishCap(pos, now_ms);
      } else if (pos.state == PositionState::Flat && !state.cap_notified) {
        // Flat but no room left under a combined cap.
        state.cap_notified = true;
        publishCap(pos, now_ms);
      }
      return std::nullopt;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// onOrderResult(): apply a confirmed fill to the pending order's side
// -----------------------------------------------------------------------------
std::optional<OrderRequest> HedgeStateMachine::onOrderResult(
    HedgeSide side, const OrderResult& result, std::int64_t now_ms) {
  SideState& state = sideState(side);
  Position& pos = state.position;

  if (!pos.pending || pos.pending->idempotency_key != result.idempotency_key) {
    std::cerr << "[HedgeStateMachine] ignoring result for "
              << result.idempotency_key << " (not pending on "
              << domain::toString(side) << ")\n";
    return std::nullopt;
  }

  OrderRequest request = *pos.pending;
  pos.pending.reset();

  if (!(result.filled_notional_usd > 0.0)) {
    halt(side, "order " + request.idempotency_key + " filled nothing",
         now_ms);
    return std::nullopt;
  }

  OrderFilledEvent filled;
  filled.side = side;
  filled.request = request;
  filled.result = result;
  filled.timestamp_ms = now_ms;
  bus_.publish(filled);

  if (request.purpose == OrderPurpose::Close) {
    double released = std::min(result.filled_notional_usd,
                               pos.total_notional_usd);
    pos.total_notional_usd -= released;

    if (pos.total_notional_usd < std::max(config_.min_order_usd, kEpsilon)) {
      if (pos.halted) {
        // Nothing left at risk: the halt no longer protects anything.
        std::cout << "[HedgeStateMachine] " << domain::toString(side)
                  << " halt cleared by close (" << pos.halt_reason << ")\n";
        pos.halted = false;
        pos.halt_reason.clear();
      }
      resetToFlat(state, now_ms);
      return std::nullopt;
    }

    // Partial close: ask for the remainder under the next close index.
    ++pos.close_index;
    OrderRequest next =
        makeRequest(pos, OrderPurpose::Close, pos.close_index,
                    pos.total_notional_usd, request.anchor_epoch);
    issued_keys_.insert(next.idempotency_key);
    pos.pending = next;
    publishPosition(pos, now_ms);
    return next;
  }

  // --- Open / ScaleIn -------------------------------------------------------
  double fill = result.filled_notional_usd;
  if (fill > request.notional_usd + kEpsilon) {
    std::cerr << "[HedgeStateMachine] " << request.idempotency_key
              << " overfilled: $" << fill << " for $" << request.notional_usd
              << "\n";
  }

  if (result.avg_price > 0.0) {
    double prior_qty = pos.avg_entry_price > 0.0
                           ? pos.total_notional_usd / pos.avg_entry_price
                           : 0.0;
    double fill_qty = fill / result.avg_price;
    pos.avg_entry_price =
        (pos.total_notional_usd + fill) / (prior_qty + fill_qty);
  }
  pos.total_notional_usd += fill;
  ++pos.legs_filled;

  PositionState next_state = request.purpose == OrderPurpose::Open
                                 ? PositionState::Entered
                                 : PositionState::Scaling;
  transition(pos, next_state,
             "leg " + std::to_string(request.leg_index) + " filled", now_ms);
  publishPosition(pos, now_ms);
  return std::nullopt;
}

void HedgeStateMachine::onOrderRejected(HedgeSide side, const std::string& key,
                                        const std::string& reason,
                                        std::int64_t now_ms) {
  Position& pos = sideState(side).position;
  if (!pos.pending || pos.pending->idempotency_key != key) {
    std::cerr << "[HedgeStateMachine] ignoring rejection for " << key << "\n";
    return;
  }
  pos.pending.reset();
  halt(side, "order " + key + " rejected: " + reason, now_ms);
}

// -----------------------------------------------------------------------------
// requestClose(): external close signal
// -----------------------------------------------------------------------------
std::optional<OrderRequest> HedgeStateMachine::requestClose(
    HedgeSide side, std::int64_t now_ms) {
  Position& pos = sideState(side).position;

  if (pos.state == PositionState::Flat || pos.total_notional_usd <= 0.0) {
    std::cout << "[HedgeStateMachine] close " << domain::toString(side)
              << ": already flat\n";
    return std::nullopt;
  }
  if (pos.pending) {
    std::cerr << "[HedgeStateMachine] close " << domain::toString(side)
              << " refused: order " << pos.pending->idempotency_key
              << " in flight\n";
    return std::nullopt;
  }

  std::uint64_t epoch = currentEpoch(pos, now_ms);
  OrderRequest request = makeRequest(pos, OrderPurpose::Close,
                                     pos.close_index, pos.total_notional_usd,
                                     epoch);
  while (issued_keys_.count(request.idempotency_key) > 0) {
    ++pos.close_index;
    request = makeRequest(pos, OrderPurpose::Close, pos.close_index,
                          pos.total_notional_usd, epoch);
  }
  issued_keys_.insert(request.idempotency_key);
  pos.pending = request;
  transition(pos, PositionState::Closing, "external close", now_ms);
  return request;
}

void HedgeStateMachine::halt(HedgeSide side, const std::string& reason,
                             std::int64_t now_ms) {
  Position& pos = sideState(side).position;
  if (pos.halted) {
    return;
  }
  pos.halted = true;
  pos.halt_reason = reason;

  std::cerr << "[HedgeStateMachine] " << domain::toString(side)
            << " halted in " << domain::toString(pos.state) << ": " << reason
            << "\n";

  SideHaltedEvent event;
  event.side = side;
  event.symbol = pos.symbol;
  event.reason = reason;
  event.timestamp_ms = now_ms;
  bus_.publish(event);
}

void HedgeStateMachine::resume(HedgeSide side, std::int64_t now_ms) {
  Position& pos = sideState(side).position;
  if (!pos.halted) {
    return;
  }
  pos.halted = false;
  pos.halt_reason.clear();
  std::cout << "[HedgeStateMachine] " << domain::toString(side)
            << " resumed\n";
  publishPosition(pos, now_ms);
}

// -----------------------------------------------------------------------------
// hydrate(): exchange wins
// -----------------------------------------------------------------------------
void HedgeStateMachine::hydrate(HedgeSide side,
                                const domain::ExchangePosition& exchange,
                                std::int64_t now_ms) {
  SideState& state = sideState(side);
  Position& pos = state.position;

  const double directional =
      side == HedgeSide::Long ? exchange.notional_usd : -exchange.notional_usd;
  const double memory = pos.total_notional_usd;
  const bool had_pending = pos.pending.has_value();

  auto mismatch = [&](const std::string& detail) {
    std::cerr << "[HedgeStateMachine] reconciliation mismatch on "
              << pos.symbol << ": " << detail << "\n";
    ReconciliationMismatchEvent event;
    event.side = side;
    event.symbol = pos.symbol;
    event.memory_notional_usd = memory;
    event.exchange_notional_usd = directional;
    event.detail = detail;
    event.timestamp_ms = now_ms;
    bus_.publish(event);
  };

  if (!std::isfinite(directional)) {
    mismatch("exchange reported a non-finite notional");
    halt(side, "exchange position on " + pos.symbol + " is not a number",
         now_ms);
    return;
  }

  if (directional < -kEpsilon) {
    mismatch("exchange position points the wrong way");
    halt(side, "exchange position on " + pos.symbol +
                   " is opposite to the hedge side",
         now_ms);
    return;
  }

  if (state.synced &&
      (std::abs(directional - memory) > 1e-6 || had_pending)) {
    mismatch("memory $" + std::to_string(memory) + " vs exchange $" +
             std::to_string(directional) +
             (had_pending ? " (pending order dropped)" : ""));
  }
  state.synced = true;
  pos.pending.reset();
  pos.close_index = 0;

  if (directional < std::max(config_.min_order_usd, kEpsilon)) {
    if (pos.state != PositionState::Flat || memory > 0.0) {
      resetToFlat(state, now_ms);
    }
    return;
  }

  pos.total_notional_usd = directional;
  pos.avg_entry_price = exchange.avg_price;
  // Clamped before the cast: a notional far beyond the ladder must not
  // overflow int.
  const double legs = std::ceil(directional / config_.usd_position_size -
                                kEpsilon);
  pos.legs_filled = static_cast<int>(
      std::clamp(legs, 1.0, static_cast<double>(kMaxRestoredLegs)));

  if (!tracker_.isFrozen(pos.symbol)) {
    if (config_.trigger_source == TriggerSource::Symbol &&
        exchange.avg_price > 0.0) {
      double mean_drop = config_.trigger_drop_pct;
      if (config_.enable_scale_in && pos.legs_filled > 1) {
        mean_drop += (pos.legs_filled - 1) * config_.scale_in_drop_step / 2.0;
      }
      double anchor = mean_drop < 100.0
                          ? exchange.avg_price / (1.0 - mean_drop / 100.0)
                          : exchange.avg_price;
      tracker_.seed(pos.symbol, anchor, now_ms);
    } else {
      tracker_.freeze(pos.symbol, now_ms);
    }
  }

  PositionState restored = pos.legs_filled == 1 ? PositionState::Entered
                                                : PositionState::Scaling;
  transition(pos, restored, "restored from exchange", now_ms);
  std::cout << "[HedgeStateMachine] " << domain::toString(side)
            << " restored from exchange: $" << pos.total_notional_usd << " in "
            << pos.legs_filled << " leg(s) @ " << pos.avg_entry_price << "\n";
  publishPosition(pos, now_ms);
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
OrderRequest HedgeStateMachine::makeRequest(const Position& pos,
                                            OrderPurpose purpose, int index,
                                            double notional,
                                            std::uint64_t epoch) const {
  OrderRequest request;
  request.idempotency_key =
      domain::makeIdempotencyKey(pos.symbol, purpose, index, epoch);
  request.symbol = pos.symbol;
  request.side = purpose == OrderPurpose::Close ? domain::exitSide(pos.side)
                                                : domain::entrySide(pos.side);
  request.notional_usd = notional;
  request.leg_index = index;
  request.purpose = purpose;
  request.anchor_epoch = epoch;
  return request;
}

std::uint64_t HedgeStateMachine::currentEpoch(const Position& pos,
                                              std::int64_t now_ms) {
  auto ref = tracker_.reference(pos.symbol);
  if (ref && ref->frozen && ref->epoch != 0) {
    return ref->epoch;
  }
  return tracker_.freeze(pos.symbol, now_ms);
}

void HedgeStateMachine::transition(Position& pos, PositionState to,
                                   const std::string& reason,
                                   std::int64_t now_ms) {
  PositionState from = pos.state;
  pos.state = to;

  std::cout << "[HedgeStateMachine] " << domain::toString(pos.side) << " "
            << domain::toString(from) << " -> " << domain::toString(to)
            << " (" << reason << ")\n";

  StateTransitionEvent event;
  event.side = pos.side;
  event.symbol = pos.symbol;
  event.from = from;
  event.to = to;
  event.reason = reason;
  event.timestamp_ms = now_ms;
  bus_.publish(event);
}

void HedgeStateMachine::resetToFlat(SideState& state, std::int64_t now_ms) {
  Position& pos = state.position;
  pos.total_notional_usd = 0.0;
  pos.legs_filled = 0;
  pos.avg_entry_price = 0.0;
  pos.close_index = 0;
  pos.pending.reset();
  state.cap_notified = false;

  tracker_.reset(pos.symbol);
  transition(pos, PositionState::Flat, "position closed", now_ms);
  publishPosition(pos, now_ms);
}

void HedgeStateMachine::publishPosition(const Position& pos,
                                        std::int64_t now_ms) {
  PositionUpdateEvent event;
  event.position = pos;
  event.timestamp_ms = now_ms;
  bus_.publish(event);
}

void HedgeStateMachine::publishCap(const Position& pos, std::int64_t now_ms) {
  CapReachedEvent event;
  event.side = pos.side;
  event.symbol = pos.symbol;
  event.total_notional_usd = pos.total_notional_usd;
  event.legs_filled = pos.legs_filled;
  event.timestamp_ms = now_ms;
  bus_.publish(event);
}

}  // namespace hedge
