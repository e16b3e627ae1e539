#pragma once

#include "hedge/time/i_time_provider.hpp"

namespace hedge {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock and
//         sleeps with std::this_thread::sleep_for.
//
// @details
// Used by the production binary. The control loop never sleeps for longer
// than its slice constant in one call, so a shutdown request is noticed
// promptly even with a long poll interval.
//
// Thread model:
//   now_ms() is safe from any thread. sleep_for_ms() blocks only the caller.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  void sleep_for_ms(std::int64_t duration_ms) override;
};

}  // namespace hedge
