#pragma once

#include "hedge/config/hedge_config.hpp"
#include "hedge/domain/order.hpp"
#include "hedge/domain/position.hpp"
#include "hedge/eventbus/event_bus.hpp"
#include "hedge/sizing/position_sizer.hpp"
#include "hedge/trigger/trigger_tracker.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace hedge {

// -----------------------------------------------------------------------------
// HedgeStateMachine — per-side lifecycle and idempotent order issuance
// -----------------------------------------------------------------------------
//
// @brief  Owns both Positions. Turns price observations into OrderRequests
//         and applies confirmed results back onto the Positions.
//
// @details
// The machine never talks to the exchange. It decides; the ControlLoop
// executes and reports the outcome back through onOrderResult() or
// onOrderRejected(). That split keeps every decision testable with plain
// values.
//
// States per side:
//
//   FLAT ──OpenInitial──> ENTERING ──fill──> ENTERED
//   ENTERED/SCALING ──ScaleIn──> SCALING(pending) ──fill──> SCALING
//   ENTERED/SCALING ──CapReached──> CAPPED
//   any non-flat, no pending ──requestClose──> CLOSING ──full fill──> FLAT
//
// Rules enforced here:
//   - No action is computed for a side with a pending order, a halted side,
//     a CAPPED side or a CLOSING side.
//   - Every transition into ENTERING or SCALING(pending) produces exactly one
//     OrderRequest. A key that was ever issued is never issued again.
//   - Position fields change only on a confirmed result (or reconciliation).
//     A result whose key is not the side's pending key is ignored.
//   - A rejected order halts the side in its current state.
//   - Combined cap: a side waits, rather than capping, while the shortfall
//     comes only from the other side's unconfirmed entry.
//   - A partial close re-issues a close for the remainder with the next
//     close index. A full close returns to FLAT and resets the anchor.
//   - CapReachedEvent is published once per cap hit.
//
// Thread model:
//   Not thread-safe. Lives on the control loop thread. STATUS replies read
//   copies taken by the control loop, never the machine directly.
//
// Ownership:
//   Holds references to the TriggerTracker and EventBus (owned by the
//   ControlLoop / main) and a copy of the config.
// -----------------------------------------------------------------------------
class HedgeStateMachine {
 public:
  HedgeStateMachine(const HedgeConfig& config, TriggerTracker& tracker,
                    EventBus& bus);

  HedgeStateMachine(const HedgeStateMachine&) = delete;
  HedgeStateMachine& operator=(const HedgeStateMachine&) = delete;

  // -------------------------------------------------------------------------
  // onPrice(side, price, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Feeds one trigger price into the tracker and decides the next
  //         action for the side.
  //
  // @param  price  Mark price of the side's symbol, or the long/short ratio
  //                in ratio mode.
  //
  // @return The OrderRequest to place, or std::nullopt.
  //
  // @throws std::invalid_argument from TriggerTracker on a non-positive
  //         price.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderRequest> onPrice(domain::HedgeSide side,
                                              double price,
                                              std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // onOrderResult(side, result, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Applies a confirmed result for the side's pending order.
  //
  // @return A follow-up request when a partial close leaves a remainder,
  //         std::nullopt otherwise.
  //
  // @details
  // Ignored (with a warning) when the key is not the pending key. A result
  // with zero filled notional halts the side.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderRequest> onOrderResult(
      domain::HedgeSide side, const domain::OrderResult& result,
      std::int64_t now_ms);

  // Clears the pending order and halts the side. Unknown keys are ignored.
  void onOrderRejected(domain::HedgeSide side, const std::string& key,
                       const std::string& reason, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // requestClose(side, now_ms)
  // -------------------------------------------------------------------------
  // @brief  External close signal.
  //
  // @return The close request for the full notional, or std::nullopt if the
  //         side is flat or has an order in flight. A halted side can still
  //         close; the fill that takes it to FLAT clears the halt.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderRequest> requestClose(domain::HedgeSide side,
                                                   std::int64_t now_ms);

  void halt(domain::HedgeSide side, const std::string& reason,
            std::int64_t now_ms);
  void resume(domain::HedgeSide side, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // hydrate(side, exchange, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Replaces the side's Position with the exchange's view.
  //
  // @details
  // The exchange always wins. Any difference from memory (or a pending
  // order being dropped) after the side was first synced is published as a
  // ReconciliationMismatchEvent. A position in the wrong direction cannot
  // be managed and halts the side.
  //
  // legs_filled is derived as ceil(notional / usd_position_size) so the
  // next leg index follows the legs already filled. When the anchor is not
  // frozen it is re-derived:
  //   symbol mode: avg_price / (1 - d / 100), where d is the mean trigger
  //                drawdown of the legs filled so far
  //   ratio mode:  frozen at the next observed ratio
  // -------------------------------------------------------------------------
  void hydrate(domain::HedgeSide side, const domain::ExchangePosition& exchange,
               std::int64_t now_ms);

  const domain::Position& position(domain::HedgeSide side) const;

  // Exposure counted against the cap for this side (see CapMode).
  double capacityUsed(domain::HedgeSide side) const;

  bool wasIssued(const std::string& key) const;

 private:
  struct SideState {
    domain::Position position;
    bool cap_notified{false};  // CapReachedEvent already published for FLAT
    bool synced{false};        // hydrate() ran at least once
  };

  SideState& sideState(domain::HedgeSide side);
  const SideState& sideState(domain::HedgeSide side) const;

  domain::OrderRequest makeRequest(const domain::Position& pos,
                                   domain::OrderPurpose purpose, int index,
                                   double notional,
                                   std::uint64_t epoch) const;

  void transition(domain::Position& pos, domain::PositionState to,
                  const std::string& reason, std::int64_t now_ms);
  void resetToFlat(SideState& state, std::int64_t now_ms);
  void publishPosition(const domain::Position& pos, std::int64_t now_ms);
  void publishCap(const domain::Position& pos, std::int64_t now_ms);
  std::uint64_t currentEpoch(const domain::Position& pos, std::int64_t now_ms);

  HedgeConfig config_;
  TriggerTracker& tracker_;
  EventBus& bus_;
  PositionSizer sizer_;

  std::array<SideState, 2> sides_;
  std::unordered_set<std::string> issued_keys_;
};

}  // namespace hedge
