#pragma once

#include "hedge/domain/reference_price.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace hedge {

// -----------------------------------------------------------------------------
// DrawdownReading — result of one observation
// -----------------------------------------------------------------------------
struct DrawdownReading {
  double pct{0.0};           // Drawdown from the anchor, clamped at 0
  double anchor_price{0.0};
  std::uint64_t epoch{0};    // Freeze stamp of the current cycle, 0 if none
  bool frozen{false};
};

// -----------------------------------------------------------------------------
// TriggerTracker — anchor and drawdown per track key
// -----------------------------------------------------------------------------
//
// @brief  Maintains one ReferencePrice per track key and converts each price
//         observation into a drawdown percentage.
//
// @details
// Anchor policy:
//   - First observation: the anchor is set to that price.
//   - Not frozen (side flat): the anchor ratchets up to the running maximum
//     and never moves down.
//   - Frozen (position open): the anchor stays fixed for the whole cycle,
//     across every scale-in tier, so each tier's threshold is measured from
//     the same reference.
//   - reset() after a full close clears the anchor; the next observation
//     starts a new one.
//
// drawdown_pct = (anchor - price) * 100 / anchor, clamped at 0.
//
// Epochs:
//   freeze() stamps the cycle with max(now_ms, last_epoch + 1). The stamp
//   goes into every idempotency key of the cycle. Being time-based it stays
//   unique across process restarts; the +1 keeps it strictly increasing
//   under a fake clock.
//
// Track keys:
//   The key is the side's symbol. In ratio mode each side's key is still its
//   own symbol but it is fed price(long)/price(short), so the two sides keep
//   independent anchors and freeze independently.
//
// Thread model:
//   Not thread-safe. Owned by the control loop and touched only from its
//   thread.
// -----------------------------------------------------------------------------
class TriggerTracker {
 public:
  // -------------------------------------------------------------------------
  // observe(key, price, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Records a price and returns the drawdown it implies.
  //
  // @throws std::invalid_argument if price is not finite and > 0. A zero or
  //         negative price would make the drawdown meaningless.
  // -------------------------------------------------------------------------
  DrawdownReading observe(const std::string& key, double price,
                          std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // freeze(key, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Fixes the anchor for the current cycle and returns its epoch.
  //
  // @details
  // Idempotent: freezing a frozen key returns the existing epoch. Freezing a
  // key that has never been observed is allowed; the anchor is then taken
  // from the next observation and stays fixed from there.
  // -------------------------------------------------------------------------
  std::uint64_t freeze(const std::string& key, std::int64_t now_ms);

  // Installs a frozen anchor directly (restart reconciliation).
  std::uint64_t seed(const std::string& key, double anchor_price,
                     std::int64_t now_ms);

  // Clears the anchor and unfreezes. The epoch history is kept.
  void reset(const std::string& key);

  std::optional<domain::ReferencePrice> reference(const std::string& key) const;

  bool isFrozen(const std::string& key) const;

  static double drawdownPct(double anchor_price, double price);

 private:
  domain::ReferencePrice& entry(const std::string& key);
  static std::uint64_t nextEpoch(domain::ReferencePrice& ref,
                                 std::int64_t now_ms);

  std::unordered_map<std::string, domain::ReferencePrice> references_;
};

}  // namespace hedge
