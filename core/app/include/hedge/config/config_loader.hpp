#pragma once

#include "hedge/config/hedge_config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace hedge {

// -----------------------------------------------------------------------------
// ConfigLoader — builds a validated HedgeConfig from file and environment
// -----------------------------------------------------------------------------
//
// @brief  Layers three configuration sources, lowest precedence first:
//
//   1. JSON file (optional). Keys are the HedgeConfig field names; unknown
//      keys are rejected so a typo cannot silently fall back to a default.
//   2. Individual environment variables:
//        SYMBOL_LONG, SYMBOL_SHORT, USD_POSITION_SIZE, MAX_USD_POSITION,
//        TRIGGER_DROP_PCT, ENABLE_SCALE_IN, SCALE_IN_LEGS,
//        SCALE_IN_DROP_STEP, POLL_INTERVAL_MS
//   3. BOT_CONFIG, a compact pipe-separated string for one-line deployment:
//        "SYMBOL_LONG|SYMBOL_SHORT|TRIGGER_PCT|POSITION_SIZE|SCALE_IN|LEGS|STEP"
//      e.g. "HYPEUSDT|JASMYUSDT|12|1500|True|3|2".
//      max_usd_position is derived as POSITION_SIZE * LEGS when scale-in is
//      enabled, POSITION_SIZE otherwise.
//
// Every parse failure (malformed JSON, wrong type, non-numeric environment
// value, short BOT_CONFIG) throws ConfigInvalid. Nothing falls back to a
// default after a parse error.
//
// Environment access goes through an injectable EnvLookup so tests never
// touch the real process environment.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string&)>;

  // Reads the real process environment via std::getenv.
  static EnvLookup processEnvironment();

  // -------------------------------------------------------------------------
  // fromJson(json, base)
  // -------------------------------------------------------------------------
  // @brief  Overlays the keys present in `json` onto `base`.
  //
  // @throws ConfigInvalid on a non-object document, an unknown key, or a
  //         value of the wrong type.
  //
  // Does NOT validate; call HedgeConfig::validate() on the final result.
  // -------------------------------------------------------------------------
  static HedgeConfig fromJson(const nlohmann::json& json,
                              HedgeConfig base = HedgeConfig{});

  // Reads and parses a JSON file, then delegates to fromJson().
  static HedgeConfig fromFile(const std::string& path);

  // Applies the individual variables and then BOT_CONFIG, if set.
  static void applyEnvironment(HedgeConfig& config, const EnvLookup& env);

  // Parses one BOT_CONFIG string into `config`.
  static void applyBotConfig(HedgeConfig& config, const std::string& packed);

  // -------------------------------------------------------------------------
  // load(path, env)
  // -------------------------------------------------------------------------
  // @brief  Full pipeline: file (skipped if path is empty) → environment →
  //         validate().
  //
  // @return A validated HedgeConfig.
  // @throws ConfigInvalid.
  // -------------------------------------------------------------------------
  static HedgeConfig load(const std::string& path, const EnvLookup& env);
};

}  // namespace hedge
