#pragma once

#include "hedge/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace hedge {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven fake clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly, and whose sleep simply advances that time.
//
// @details
// This is what makes the control loop deterministic under test:
//   - No wall-clock dependency: a 30 s poll interval costs nothing.
//   - Reproducibility: identical price scripts produce identical anchor
//     epochs, idempotency keys, and backoff timelines on every run.
//   - Observability: total_slept_ms() lets a test assert how much backoff
//     the loop applied.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_ and total_slept_ms_. Atomics give
//   the cross-thread visibility the ITimeProvider contract requires without
//   a mutex.
//
// Ownership:
//   Created by the test (or a replay harness) and passed by reference.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  start_ms  Initial clock value. Defaults to 0 ("nothing replayed").
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // sleep_for_ms(duration_ms) override
  // -------------------------------------------------------------------------
  // @brief  Advances the clock by duration_ms without blocking.
  //
  // @details
  // Also accumulates duration_ms into total_slept_ms(). Non-positive values
  // are ignored.
  // -------------------------------------------------------------------------
  void sleep_for_ms(std::int64_t duration_ms) override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility. Being able to set arbitrary
  // times is useful in tests (e.g. aging a cached price past its staleness
  // limit).
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Sum of all durations passed to sleep_for_ms() since construction.
  std::int64_t total_slept_ms() const;

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
  std::atomic<std::int64_t> total_slept_ms_{0};
};

}  // namespace hedge
