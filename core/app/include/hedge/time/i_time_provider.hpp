#pragma once

#include <cstdint>

namespace hedge {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source and suspension point
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" and "wait"
//         away from std::chrono and std::this_thread.
//
// @details
// The control loop has exactly two kinds of suspension: the poll-interval
// sleep between ticks and the backoff sleep between retries. Both go through
// sleep_for_ms() so a test can drive the loop with a fake clock:
//
//   - LiveTimeProvider       → system_clock for now_ms(), a real sleep.
//   - SimulationTimeProvider → an atomic counter; sleep_for_ms() advances it
//                              instantly, so a test replays hours of polling
//                              in microseconds and every timestamp is
//                              deterministic.
//
// Components receive `ITimeProvider&` (or `const ITimeProvider&` if they only
// read the time) and do not know which implementation they got.
//
// Thread-safety contract:
//   now_ms() must be safe for concurrent reads (the price feed thread stamps
//   incoming ticks while the control loop reads). sleep_for_ms() is only
//   called from the control loop thread.
//
// Ownership:
//   Components hold references; they do NOT own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_for_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Suspends the caller for duration_ms (real or simulated).
  //
  // @param  duration_ms  Non-positive values return immediately.
  //
  // Thread-safety: Call from the control loop thread only.
  // -------------------------------------------------------------------------
  virtual void sleep_for_ms(std::int64_t duration_ms) = 0;
};

}  // namespace hedge
