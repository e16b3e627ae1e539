#include "hedge/config/hedge_config.hpp"

#include <cmath>

namespace hedge {

namespace {

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigInvalid(message);
  }
}

bool isFinite(double v) { return std::isfinite(v); }

}  // namespace

// -----------------------------------------------------------------------------
// validate(): fail fast on the first invalid parameter
// -----------------------------------------------------------------------------
void HedgeConfig::validate() const {
  require(!symbol_long.empty(), "symbol_long must not be empty");
  require(!symbol_short.empty(), "symbol_short must not be empty");
  require(symbol_long != symbol_short,
          "symbol_long and symbol_short must differ (both are '" +
              symbol_long + "')");

  require(isFinite(usd_position_size) && usd_position_size > 0.0,
          "usd_position_size must be > 0");
  require(isFinite(max_usd_position) && max_usd_position >= usd_position_size,
          "max_usd_position must be >= usd_position_size");
  require(isFinite(min_order_usd) && min_order_usd >= 0.0,
          "min_order_usd must be >= 0");

  require(isFinite(trigger_drop_pct) && trigger_drop_pct > 0.0 &&
              trigger_drop_pct < 100.0,
          "trigger_drop_pct must be in (0, 100)");

  if (enable_scale_in) {
    require(scale_in_legs >= 1, "scale_in_legs must be >= 1 when scale-in is "
                                "enabled");
    require(isFinite(scale_in_drop_step) && scale_in_drop_step > 0.0,
            "scale_in_drop_step must be > 0 when scale-in is enabled");
  }

  require(poll_interval_ms > 0, "poll_interval_ms must be > 0");
  require(call_timeout_ms > 0, "call_timeout_ms must be > 0");
  require(price_stale_ms > 0, "price_stale_ms must be > 0");

  require(retry_max_attempts >= 1, "retry_max_attempts must be >= 1");
  require(retry_initial_backoff_ms >= 0,
          "retry_initial_backoff_ms must be >= 0");
  require(retry_max_backoff_ms >= retry_initial_backoff_ms,
          "retry_max_backoff_ms must be >= retry_initial_backoff_ms");
  require(isFinite(retry_backoff_multiplier) && retry_backoff_multiplier >= 1.0,
          "retry_backoff_multiplier must be >= 1");
}

const char* toString(CapMode mode) {
  switch (mode) {
    case CapMode::PerSide:  return "per_side";
    case CapMode::Combined: return "combined";
  }
  return "unknown";
}

const char* toString(TriggerSource source) {
  switch (source) {
    case TriggerSource::Symbol: return "symbol";
    case TriggerSource::Ratio:  return "ratio";
  }
  return "unknown";
}

}  // namespace hedge
