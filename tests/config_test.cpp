// =============================================================================
// config_test.cpp
// =============================================================================
// Unit tests for hedge::HedgeConfig::validate() and hedge::ConfigLoader.
//
// Validates:
//   - Default-constructed config plus symbols is valid
//   - Every validation rule fails with ConfigInvalid
//   - JSON overlay: known keys, enum strings, unknown key, wrong type,
//     fractional values for integer fields
//   - File loading, missing file, malformed JSON
//   - Individual environment overrides
//   - BOT_CONFIG pipe format, cap derivation, malformed input
//   - Precedence: file < environment < BOT_CONFIG
// =============================================================================

#include "hedge/config/config_loader.hpp"
#include "hedge/config/hedge_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <string>

using hedge::CapMode;
using hedge::ConfigInvalid;
using hedge::ConfigLoader;
using hedge::HedgeConfig;
using hedge::TriggerSource;

class ConfigTest : public ::testing::Test {
 protected:
  std::map<std::string, std::string> env_vars;

  ConfigLoader::EnvLookup env() const {
    auto vars = env_vars;
    return [vars](const std::string& name) -> std::optional<std::string> {
      auto it = vars.find(name);
      if (it == vars.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  static HedgeConfig valid() {
    HedgeConfig cfg;
    cfg.symbol_long = "HYPEUSDT";
    cfg.symbol_short = "JASMYUSDT";
    return cfg;
  }

  static std::string writeFile(const std::string& name,
                               const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
  }
};

// -----------------------------------------------------------------------------
// 1. Defaults with two distinct symbols pass validation.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, DefaultsWithSymbolsAreValid) {
  HedgeConfig cfg = valid();
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_DOUBLE_EQ(cfg.usd_position_size, 1500.0);
  EXPECT_DOUBLE_EQ(cfg.trigger_drop_pct, 12.0);
  EXPECT_EQ(cfg.cap_mode, CapMode::PerSide);
  EXPECT_EQ(cfg.trigger_source, TriggerSource::Symbol);
  EXPECT_FALSE(cfg.enable_scale_in);
}

// -----------------------------------------------------------------------------
// 2. Each rule rejects its invalid input.
// Why: A bad parameter must stop the process before any order is placed.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, EmptySymbolIsInvalid) {
  HedgeConfig cfg = valid();
  cfg.symbol_short.clear();
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

TEST_F(ConfigTest, IdenticalSymbolsAreInvalid) {
  HedgeConfig cfg = valid();
  cfg.symbol_short = cfg.symbol_long;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

TEST_F(ConfigTest, NonPositivePositionSizeIsInvalid) {
  HedgeConfig cfg = valid();
  cfg.usd_position_size = 0.0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

TEST_F(ConfigTest, CapBelowPositionSizeIsInvalid) {
  HedgeConfig cfg = valid();
  cfg.max_usd_position = 1000.0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

TEST_F(ConfigTest, TriggerOutsideOpenIntervalIsInvalid) {
  HedgeConfig cfg = valid();
  cfg.trigger_drop_pct = 0.0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
  cfg.trigger_drop_pct = 100.0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

TEST_F(ConfigTest, ScaleInRulesApplyOnlyWhenEnabled) {
  HedgeConfig cfg = valid();
  cfg.scale_in_legs = 0;
  cfg.scale_in_drop_step = 0.0;
  EXPECT_NO_THROW(cfg.validate());

  cfg.enable_scale_in = true;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);

  cfg.scale_in_legs = 3;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);

  cfg.scale_in_drop_step = 2.0;
  EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, RetrySettingsAreChecked) {
  HedgeConfig cfg = valid();
  cfg.retry_max_attempts = 0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);

  cfg = valid();
  cfg.retry_max_backoff_ms = 100;
  cfg.retry_initial_backoff_ms = 500;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);

  cfg = valid();
  cfg.retry_backoff_multiplier = 0.5;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);

  cfg = valid();
  cfg.poll_interval_ms = 0;
  EXPECT_THROW(cfg.validate(), ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 3. JSON overlay maps every key by field name.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, FromJsonOverlaysKnownKeys) {
  nlohmann::json j = {
      {"symbol_long", "BTCUSDT"},     {"symbol_short", "ETHUSDT"},
      {"usd_position_size", 500.0},   {"max_usd_position", 2000.0},
      {"cap_mode", "combined"},       {"trigger_drop_pct", 8.5},
      {"trigger_source", "ratio"},    {"enable_scale_in", true},
      {"scale_in_legs", 4},           {"scale_in_drop_step", 1.5},
      {"poll_interval_ms", 1000},     {"retry_max_attempts", 7},
      {"market_data_endpoint", "tcp://127.0.0.1:5555"}};

  HedgeConfig cfg = ConfigLoader::fromJson(j);

  EXPECT_EQ(cfg.symbol_long, "BTCUSDT");
  EXPECT_EQ(cfg.symbol_short, "ETHUSDT");
  EXPECT_DOUBLE_EQ(cfg.usd_position_size, 500.0);
  EXPECT_DOUBLE_EQ(cfg.max_usd_position, 2000.0);
  EXPECT_EQ(cfg.cap_mode, CapMode::Combined);
  EXPECT_DOUBLE_EQ(cfg.trigger_drop_pct, 8.5);
  EXPECT_EQ(cfg.trigger_source, TriggerSource::Ratio);
  EXPECT_TRUE(cfg.enable_scale_in);
  EXPECT_EQ(cfg.scale_in_legs, 4);
  EXPECT_DOUBLE_EQ(cfg.scale_in_drop_step, 1.5);
  EXPECT_EQ(cfg.poll_interval_ms, 1000);
  EXPECT_EQ(cfg.retry_max_attempts, 7);
  EXPECT_EQ(cfg.market_data_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_NO_THROW(cfg.validate());
}

// -----------------------------------------------------------------------------
// 4. A misspelled key is an error, not a silently ignored setting.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, UnknownJsonKeyIsInvalid) {
  nlohmann::json j = {{"symbol_long", "BTCUSDT"}, {"trigger_pct", 10.0}};
  EXPECT_THROW(ConfigLoader::fromJson(j), ConfigInvalid);
}

TEST_F(ConfigTest, WrongJsonTypeIsInvalid) {
  nlohmann::json j = {{"usd_position_size", "lots"}};
  EXPECT_THROW(ConfigLoader::fromJson(j), ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 4b. Integer fields refuse fractional numbers instead of truncating them.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, FractionalIntegerFieldIsInvalid) {
  nlohmann::json poll = {{"poll_interval_ms", 3.5}};
  nlohmann::json legs = {{"scale_in_legs", 2.0}};
  nlohmann::json attempts = {{"retry_max_attempts", "5"}};
  EXPECT_THROW(ConfigLoader::fromJson(poll), ConfigInvalid);
  EXPECT_THROW(ConfigLoader::fromJson(legs), ConfigInvalid);
  EXPECT_THROW(ConfigLoader::fromJson(attempts), ConfigInvalid);

  nlohmann::json whole = {{"poll_interval_ms", 3}};
  EXPECT_EQ(ConfigLoader::fromJson(whole).poll_interval_ms, 3);
}

TEST_F(ConfigTest, BadEnumStringIsInvalid) {
  nlohmann::json cap_mode = {{"cap_mode", "shared"}};
  nlohmann::json source = {{"trigger_source", "spread"}};
  EXPECT_THROW(ConfigLoader::fromJson(cap_mode), ConfigInvalid);
  EXPECT_THROW(ConfigLoader::fromJson(source), ConfigInvalid);
}

TEST_F(ConfigTest, NonObjectDocumentIsInvalid) {
  EXPECT_THROW(ConfigLoader::fromJson(nlohmann::json::array()),
               ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 5. File loading.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, FromFileReadsJson) {
  std::string path = writeFile(
      "hedge_config_ok.json",
      R"({"symbol_long": "SOLUSDT", "symbol_short": "DOGEUSDT",
          "trigger_drop_pct": 10})");

  HedgeConfig cfg = ConfigLoader::fromFile(path);
  EXPECT_EQ(cfg.symbol_long, "SOLUSDT");
  EXPECT_EQ(cfg.symbol_short, "DOGEUSDT");
  EXPECT_DOUBLE_EQ(cfg.trigger_drop_pct, 10.0);
}

TEST_F(ConfigTest, MissingFileIsInvalid) {
  EXPECT_THROW(ConfigLoader::fromFile(::testing::TempDir() + "no_such.json"),
               ConfigInvalid);
}

TEST_F(ConfigTest, MalformedFileIsInvalid) {
  std::string path = writeFile("hedge_config_bad.json", "{ \"symbol_long\": ");
  EXPECT_THROW(ConfigLoader::fromFile(path), ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 6. Individual environment variables override the base config.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, EnvironmentOverridesFields) {
  env_vars = {{"SYMBOL_LONG", "BTCUSDT"},     {"SYMBOL_SHORT", " ETHUSDT "},
              {"USD_POSITION_SIZE", "250"},   {"MAX_USD_POSITION", "750"},
              {"TRIGGER_DROP_PCT", "7.5"},    {"ENABLE_SCALE_IN", "yes"},
              {"SCALE_IN_LEGS", "3"},         {"SCALE_IN_DROP_STEP", "2.5"},
              {"POLL_INTERVAL_MS", "5000"}};

  HedgeConfig cfg = valid();
  ConfigLoader::applyEnvironment(cfg, env());

  EXPECT_EQ(cfg.symbol_long, "BTCUSDT");
  EXPECT_EQ(cfg.symbol_short, "ETHUSDT");
  EXPECT_DOUBLE_EQ(cfg.usd_position_size, 250.0);
  EXPECT_DOUBLE_EQ(cfg.max_usd_position, 750.0);
  EXPECT_DOUBLE_EQ(cfg.trigger_drop_pct, 7.5);
  EXPECT_TRUE(cfg.enable_scale_in);
  EXPECT_EQ(cfg.scale_in_legs, 3);
  EXPECT_DOUBLE_EQ(cfg.scale_in_drop_step, 2.5);
  EXPECT_EQ(cfg.poll_interval_ms, 5000);
}

TEST_F(ConfigTest, UnparsableEnvironmentValueIsInvalid) {
  env_vars = {{"TRIGGER_DROP_PCT", "twelve"}};
  HedgeConfig cfg = valid();
  EXPECT_THROW(ConfigLoader::applyEnvironment(cfg, env()), ConfigInvalid);

  env_vars = {{"ENABLE_SCALE_IN", "maybe"}};
  cfg = valid();
  EXPECT_THROW(ConfigLoader::applyEnvironment(cfg, env()), ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 7. BOT_CONFIG: LONG|SHORT|TRIGGER|SIZE|SCALE_IN|LEGS|STEP.
// Why: The cap is derived from the leg count so the configured ladder can
//      actually fill.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, BotConfigWithScaleInDerivesCap) {
  HedgeConfig cfg = valid();
  ConfigLoader::applyBotConfig(cfg, "SOLUSDT|DOGEUSDT|8|1000|true|3|2");

  EXPECT_EQ(cfg.symbol_long, "SOLUSDT");
  EXPECT_EQ(cfg.symbol_short, "DOGEUSDT");
  EXPECT_DOUBLE_EQ(cfg.trigger_drop_pct, 8.0);
  EXPECT_DOUBLE_EQ(cfg.usd_position_size, 1000.0);
  EXPECT_TRUE(cfg.enable_scale_in);
  EXPECT_EQ(cfg.scale_in_legs, 3);
  EXPECT_DOUBLE_EQ(cfg.scale_in_drop_step, 2.0);
  EXPECT_DOUBLE_EQ(cfg.max_usd_position, 3000.0);
  EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, BotConfigWithoutScaleInCapsAtOneLeg) {
  HedgeConfig cfg = valid();
  ConfigLoader::applyBotConfig(cfg,
                               "SOLUSDT | DOGEUSDT | 12 | 1500 | false | 5 | 2");

  EXPECT_FALSE(cfg.enable_scale_in);
  EXPECT_DOUBLE_EQ(cfg.max_usd_position, 1500.0);
}

TEST_F(ConfigTest, ShortBotConfigIsInvalid) {
  HedgeConfig cfg = valid();
  EXPECT_THROW(ConfigLoader::applyBotConfig(cfg, "SOLUSDT|DOGEUSDT|8|1000"),
               ConfigInvalid);
}

TEST_F(ConfigTest, BotConfigWithBadNumberIsInvalid) {
  HedgeConfig cfg = valid();
  EXPECT_THROW(
      ConfigLoader::applyBotConfig(cfg, "SOLUSDT|DOGEUSDT|x|1000|true|3|2"),
      ConfigInvalid);
}

// -----------------------------------------------------------------------------
// 8. load(): file, then individual variables, then BOT_CONFIG, then
//    validate.
// -----------------------------------------------------------------------------
TEST_F(ConfigTest, LoadAppliesPrecedence) {
  std::string path = writeFile(
      "hedge_config_precedence.json",
      R"({"symbol_long": "FILELONG", "symbol_short": "FILESHORT",
          "trigger_drop_pct": 20, "usd_position_size": 100,
          "max_usd_position": 100, "poll_interval_ms": 1234})");

  env_vars = {{"TRIGGER_DROP_PCT", "15"}, {"SYMBOL_LONG", "ENVLONG"}};
  HedgeConfig from_env = ConfigLoader::load(path, env());
  EXPECT_EQ(from_env.symbol_long, "ENVLONG");
  EXPECT_EQ(from_env.symbol_short, "FILESHORT");
  EXPECT_DOUBLE_EQ(from_env.trigger_drop_pct, 15.0);
  EXPECT_EQ(from_env.poll_interval_ms, 1234);

  env_vars["BOT_CONFIG"] = "BOTLONG|BOTSHORT|9|200|false|1|1";
  HedgeConfig from_bot = ConfigLoader::load(path, env());
  EXPECT_EQ(from_bot.symbol_long, "BOTLONG");
  EXPECT_EQ(from_bot.symbol_short, "BOTSHORT");
  EXPECT_DOUBLE_EQ(from_bot.trigger_drop_pct, 9.0);
  EXPECT_DOUBLE_EQ(from_bot.usd_position_size, 200.0);
  EXPECT_DOUBLE_EQ(from_bot.max_usd_position, 200.0);
  EXPECT_EQ(from_bot.poll_interval_ms, 1234);
}

TEST_F(ConfigTest, LoadValidatesResult) {
  // No file and no symbols anywhere: validation must fail.
  EXPECT_THROW(ConfigLoader::load("", env()), ConfigInvalid);
}
