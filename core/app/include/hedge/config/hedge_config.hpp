#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hedge {

// -----------------------------------------------------------------------------
// ConfigInvalid — fatal startup-time configuration error
// -----------------------------------------------------------------------------
// Thrown by HedgeConfig::validate() and ConfigLoader. main() reports it and
// exits before the control loop starts.
// -----------------------------------------------------------------------------
class ConfigInvalid : public std::runtime_error {
 public:
  explicit ConfigInvalid(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// CapMode — how max_usd_position is applied across the two hedge sides
// -----------------------------------------------------------------------------
enum class CapMode {
  PerSide,   // each side capped independently (default)
  Combined,  // long + short notional share one cap
};

// -----------------------------------------------------------------------------
// TriggerSource — which price series drives the drawdown
// -----------------------------------------------------------------------------
enum class TriggerSource {
  Symbol,  // each side watches its own symbol's mark price (default)
  Ratio,   // both sides watch price(symbol_long) / price(symbol_short)
};

// -----------------------------------------------------------------------------
// HedgeConfig — immutable, validated parameters for one run
// -----------------------------------------------------------------------------
//
// @brief  Symbols, sizing, trigger thresholds, scale-in policy, and the
//         control loop's timing/retry parameters.
//
// @details
// Built once by ConfigLoader, validated, then copied by value into every
// component that needs it. Never mutated after validate() succeeds.
//
// Sizing invariant (scale-in enabled):
//   usd_position_size * scale_in_legs <= max_usd_position is NOT enforced.
//   When it does not hold, the later legs are silently truncated at the cap
//   by PositionSizer instead of being rejected here.
// -----------------------------------------------------------------------------
struct HedgeConfig {
  // --- Instruments ----------------------------------------------------------
  std::string symbol_long;
  std::string symbol_short;

  // --- Sizing ---------------------------------------------------------------
  double usd_position_size{1500.0};  // Notional of one leg
  double max_usd_position{1500.0};   // Cap on total notional (see cap_mode)
  double min_order_usd{1.0};         // Smallest order the venue accepts
  CapMode cap_mode{CapMode::PerSide};

  // --- Trigger --------------------------------------------------------------
  double trigger_drop_pct{12.0};  // Drawdown (%) that opens the first leg
  TriggerSource trigger_source{TriggerSource::Symbol};

  // --- Scale-in -------------------------------------------------------------
  bool enable_scale_in{false};
  int scale_in_legs{1};             // Total legs, the initial one included
  double scale_in_drop_step{2.0};   // Extra drawdown (%) per additional leg

  // --- Control loop timing --------------------------------------------------
  std::int64_t poll_interval_ms{30000};
  std::int64_t call_timeout_ms{10000};
  std::int64_t price_stale_ms{60000};

  // --- Retry / backoff (per collaborator call, per tick) --------------------
  int retry_max_attempts{5};
  std::int64_t retry_initial_backoff_ms{500};
  std::int64_t retry_max_backoff_ms{10000};
  double retry_backoff_multiplier{2.0};

  // --- Endpoints (empty disables the socket) --------------------------------
  std::string market_data_endpoint;
  std::string ipc_cmd_endpoint;
  std::string ipc_pub_endpoint;

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @brief  Checks every field and every cross-field constraint.
  //
  // @throws ConfigInvalid naming the first offending parameter.
  //
  // @details
  // Rules:
  //   symbol_long, symbol_short non-empty and different
  //   usd_position_size > 0
  //   max_usd_position >= usd_position_size
  //   0 < trigger_drop_pct < 100
  //   scale_in_legs >= 1 and scale_in_drop_step > 0 when scale-in is enabled
  //   min_order_usd >= 0
  //   poll_interval_ms, call_timeout_ms, price_stale_ms > 0
  //   retry_max_attempts >= 1, backoff values non-negative and ordered,
  //   retry_backoff_multiplier >= 1
  // -------------------------------------------------------------------------
  void validate() const;
};

const char* toString(CapMode mode);
const char* toString(TriggerSource source);

}  // namespace hedge
