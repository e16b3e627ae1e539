#pragma once

#include <cstdint>
#include <string>

namespace hedge {
namespace domain {

// -----------------------------------------------------------------------------
// ReferencePrice — per-symbol anchor for drawdown measurement
// -----------------------------------------------------------------------------
//
// @brief  The high-water price a side's drawdown is measured from.
//
// @details
// Created on the first price observation for a symbol. While frozen is
// false, anchor_price ratchets up to the running maximum. Once a position
// opens the anchor is frozen and epoch records when, so that every order of
// the cycle carries the same epoch in its idempotency key.
//
// anchor_price == 0.0 means "no anchor yet": the next observation sets it.
// last_epoch is kept across resets so a new cycle always gets a strictly
// larger epoch, even under a fake clock that has not advanced.
//
// Ownership: TriggerTracker owns the authoritative copy.
// -----------------------------------------------------------------------------
struct ReferencePrice {
  std::string symbol;
  double anchor_price{0.0};
  double last_observed_price{0.0};
  std::int64_t updated_at_ms{0};

  bool frozen{false};
  std::uint64_t epoch{0};       // Freeze stamp of the current cycle, 0 if none
  std::uint64_t last_epoch{0};  // Highest epoch ever issued for this symbol
};

}  // namespace domain
}  // namespace hedge
