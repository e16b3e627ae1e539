#include "hedge/trigger/trigger_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hedge {

domain::ReferencePrice& TriggerTracker::entry(const std::string& key) {
  auto [it, inserted] = references_.try_emplace(key);
  if (inserted) {
    it->second.symbol = key;
  }
  return it->second;
}

std::uint64_t TriggerTracker::nextEpoch(domain::ReferencePrice& ref,
                                        std::int64_t now_ms) {
  std::uint64_t stamp = now_ms > 0 ? static_cast<std::uint64_t>(now_ms) : 0;
  std::uint64_t epoch = std::max(stamp, ref.last_epoch + 1);
  ref.last_epoch = epoch;
  return epoch;
}

// -----------------------------------------------------------------------------
// observe(): ratchet (unless frozen), then measure
// -----------------------------------------------------------------------------
DrawdownReading TriggerTracker::observe(const std::string& key, double price,
                                        std::int64_t now_ms) {
  if (!std::isfinite(price) || price <= 0.0) {
    throw std::invalid_argument("TriggerTracker: invalid price for " + key);
  }

  domain::ReferencePrice& ref = entry(key);

  if (ref.anchor_price <= 0.0) {
    ref.anchor_price = price;
  } else if (!ref.frozen && price > ref.anchor_price) {
    ref.anchor_price = price;
  }

  ref.last_observed_price = price;
  ref.updated_at_ms = now_ms;

  DrawdownReading reading;
  reading.pct = drawdownPct(ref.anchor_price, price);
  reading.anchor_price = ref.anchor_price;
  reading.epoch = ref.epoch;
  reading.frozen = ref.frozen;
  return reading;
}

std::uint64_t TriggerTracker::freeze(const std::string& key,
                                     std::int64_t now_ms) {
  domain::ReferencePrice& ref = entry(key);
  if (ref.frozen) {
    return ref.epoch;
  }
  ref.frozen = true;
  ref.epoch = nextEpoch(ref, now_ms);
  return ref.epoch;
}

std::uint64_t TriggerTracker::seed(const std::string& key, double anchor_price,
                                   std::int64_t now_ms) {
  if (!std::isfinite(anchor_price) || anchor_price <= 0.0) {
    throw std::invalid_argument("TriggerTracker: invalid seed anchor for " +
                                key);
  }
  domain::ReferencePrice& ref = entry(key);
  ref.anchor_price = anchor_price;
  ref.updated_at_ms = now_ms;
  if (!ref.frozen) {
    ref.frozen = true;
    ref.epoch = nextEpoch(ref, now_ms);
  }
  return ref.epoch;
}

void TriggerTracker::reset(const std::string& key) {
  domain::ReferencePrice& ref = entry(key);
  ref.anchor_price = 0.0;
  ref.frozen = false;
  ref.epoch = 0;
}

std::optional<domain::ReferencePrice> TriggerTracker::reference(
    const std::string& key) const {
  auto it = references_.find(key);
  if (it == references_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TriggerTracker::isFrozen(const std::string& key) const {
  auto it = references_.find(key);
  return it != references_.end() && it->second.frozen;
}

double TriggerTracker::drawdownPct(double anchor_price, double price) {
  if (anchor_price <= 0.0) {
    return 0.0;
  }
  // Multiply first: (100 - 88) * 100 / 100 is exactly 12.
  double pct = (anchor_price - price) * 100.0 / anchor_price;
  return pct > 0.0 ? pct : 0.0;
}

}  // namespace hedge
