#include "hedge/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace hedge {

namespace {

std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

double parseDouble(const std::string& name, const std::string& raw) {
  std::string value = trim(raw);
  try {
    std::size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception&) {
    // Falls through to the ConfigInvalid below with the offending name.
  }
  throw ConfigInvalid(name + ": expected a number, got '" + raw + "'");
}

std::int64_t parseInt(const std::string& name, const std::string& raw) {
  std::string value = trim(raw);
  try {
    std::size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed == value.size()) {
      return static_cast<std::int64_t>(parsed);
    }
  } catch (const std::exception&) {
    // Falls through to the ConfigInvalid below with the offending name.
  }
  throw ConfigInvalid(name + ": expected an integer, got '" + raw + "'");
}

bool parseBool(const std::string& name, const std::string& raw) {
  std::string value = lower(trim(raw));
  if (value == "true" || value == "1" || value == "yes") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no") {
    return false;
  }
  throw ConfigInvalid(name + ": expected true/false, got '" + raw + "'");
}

CapMode parseCapMode(const std::string& raw) {
  std::string value = lower(trim(raw));
  if (value == "per_side") return CapMode::PerSide;
  if (value == "combined") return CapMode::Combined;
  throw ConfigInvalid("cap_mode: expected per_side or combined, got '" + raw +
                      "'");
}

TriggerSource parseTriggerSource(const std::string& raw) {
  std::string value = lower(trim(raw));
  if (value == "symbol") return TriggerSource::Symbol;
  if (value == "ratio") return TriggerSource::Ratio;
  throw ConfigInvalid("trigger_source: expected symbol or ratio, got '" + raw +
                      "'");
}

int toLegCount(const std::string& name, std::int64_t v) {
  if (v < 0 || v > 1000) {
    throw ConfigInvalid(name + ": out of range (" + std::to_string(v) + ")");
  }
  return static_cast<int>(v);
}

// JSON integers only: get<int64_t>() would silently truncate 3.5 to 3.
std::int64_t jsonInteger(const std::string& name,
                         const nlohmann::json& value) {
  if (!value.is_number_integer()) {
    throw ConfigInvalid(name + ": expected an integer, got " + value.dump());
  }
  return value.get<std::int64_t>();
}

}  // namespace

// -----------------------------------------------------------------------------
// processEnvironment(): std::getenv-backed lookup
// -----------------------------------------------------------------------------
ConfigLoader::EnvLookup ConfigLoader::processEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

// -----------------------------------------------------------------------------
// fromJson(): overlay known keys, reject unknown ones
// -----------------------------------------------------------------------------
HedgeConfig ConfigLoader::fromJson(const nlohmann::json& json,
                                   HedgeConfig base) {
  if (!json.is_object()) {
    throw ConfigInvalid("config document must be a JSON object");
  }

  HedgeConfig cfg = std::move(base);

  try {
    for (const auto& [key, value] : json.items()) {
      if (key == "symbol_long") {
        cfg.symbol_long = value.get<std::string>();
      } else if (key == "symbol_short") {
        cfg.symbol_short = value.get<std::string>();
      } else if (key == "usd_position_size") {
        cfg.usd_position_size = value.get<double>();
      } else if (key == "max_usd_position") {
        cfg.max_usd_position = value.get<double>();
      } else if (key == "min_order_usd") {
        cfg.min_order_usd = value.get<double>();
      } else if (key == "cap_mode") {
        cfg.cap_mode = parseCapMode(value.get<std::string>());
      } else if (key == "trigger_drop_pct") {
        cfg.trigger_drop_pct = value.get<double>();
      } else if (key == "trigger_source") {
        cfg.trigger_source = parseTriggerSource(value.get<std::string>());
      } else if (key == "enable_scale_in") {
        cfg.enable_scale_in = value.get<bool>();
      } else if (key == "scale_in_legs") {
        cfg.scale_in_legs = toLegCount(key, jsonInteger(key, value));
      } else if (key == "scale_in_drop_step") {
        cfg.scale_in_drop_step = value.get<double>();
      } else if (key == "poll_interval_ms") {
        cfg.poll_interval_ms = jsonInteger(key, value);
      } else if (key == "call_timeout_ms") {
        cfg.call_timeout_ms = jsonInteger(key, value);
      } else if (key == "price_stale_ms") {
        cfg.price_stale_ms = jsonInteger(key, value);
      } else if (key == "retry_max_attempts") {
        cfg.retry_max_attempts = toLegCount(key, jsonInteger(key, value));
      } else if (key == "retry_initial_backoff_ms") {
        cfg.retry_initial_backoff_ms = jsonInteger(key, value);
      } else if (key == "retry_max_backoff_ms") {
        cfg.retry_max_backoff_ms = jsonInteger(key, value);
      } else if (key == "retry_backoff_multiplier") {
        cfg.retry_backoff_multiplier = value.get<double>();
      } else if (key == "market_data_endpoint") {
        cfg.market_data_endpoint = value.get<std::string>();
      } else if (key == "ipc_cmd_endpoint") {
        cfg.ipc_cmd_endpoint = value.get<std::string>();
      } else if (key == "ipc_pub_endpoint") {
        cfg.ipc_pub_endpoint = value.get<std::string>();
      } else {
        throw ConfigInvalid("unknown config key '" + key + "'");
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigInvalid(std::string("config type error: ") + e.what());
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// fromFile(): read + parse JSON
// -----------------------------------------------------------------------------
HedgeConfig ConfigLoader::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigInvalid("cannot open config file '" + path + "'");
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigInvalid("config file '" + path + "' is not valid JSON: " +
                        e.what());
  }

  std::cout << "[ConfigLoader] loaded " << path << "\n";
  return fromJson(json);
}

// -----------------------------------------------------------------------------
// applyEnvironment(): individual variables first, then BOT_CONFIG
// -----------------------------------------------------------------------------
void ConfigLoader::applyEnvironment(HedgeConfig& config,
                                    const EnvLookup& env) {
  if (auto v = env("SYMBOL_LONG")) config.symbol_long = trim(*v);
  if (auto v = env("SYMBOL_SHORT")) config.symbol_short = trim(*v);
  if (auto v = env("USD_POSITION_SIZE")) {
    config.usd_position_size = parseDouble("USD_POSITION_SIZE", *v);
  }
  if (auto v = env("MAX_USD_POSITION")) {
    config.max_usd_position = parseDouble("MAX_USD_POSITION", *v);
  }
  if (auto v = env("TRIGGER_DROP_PCT")) {
    config.trigger_drop_pct = parseDouble("TRIGGER_DROP_PCT", *v);
  }
  if (auto v = env("ENABLE_SCALE_IN")) {
    config.enable_scale_in = parseBool("ENABLE_SCALE_IN", *v);
  }
  if (auto v = env("SCALE_IN_LEGS")) {
    config.scale_in_legs =
        toLegCount("SCALE_IN_LEGS", parseInt("SCALE_IN_LEGS", *v));
  }
  if (auto v = env("SCALE_IN_DROP_STEP")) {
    config.scale_in_drop_step = parseDouble("SCALE_IN_DROP_STEP", *v);
  }
  if (auto v = env("POLL_INTERVAL_MS")) {
    config.poll_interval_ms = parseInt("POLL_INTERVAL_MS", *v);
  }

  if (auto v = env("BOT_CONFIG")) {
    applyBotConfig(config, *v);
    std::cout << "[ConfigLoader] using BOT_CONFIG: " << config.symbol_long
              << "/" << config.symbol_short << ", "
              << config.trigger_drop_pct << "% trigger, $"
              << config.usd_position_size << "\n";
  }
}

// -----------------------------------------------------------------------------
// applyBotConfig(): "LONG|SHORT|TRIGGER|SIZE|SCALE_IN|LEGS|STEP"
// -----------------------------------------------------------------------------
void ConfigLoader::applyBotConfig(HedgeConfig& config,
                                  const std::string& packed) {
  std::vector<std::string> parts;
  std::stringstream ss(packed);
  std::string part;
  while (std::getline(ss, part, '|')) {
    parts.push_back(trim(part));
  }

  if (parts.size() < 7) {
    throw ConfigInvalid(
        "BOT_CONFIG must have 7 fields "
        "(LONG|SHORT|TRIGGER_PCT|POSITION_SIZE|SCALE_IN|LEGS|STEP), got " +
        std::to_string(parts.size()));
  }

  config.symbol_long = parts[0];
  config.symbol_short = parts[1];
  config.trigger_drop_pct = parseDouble("BOT_CONFIG trigger", parts[2]);
  config.usd_position_size = parseDouble("BOT_CONFIG size", parts[3]);
  config.enable_scale_in = parseBool("BOT_CONFIG scale_in", parts[4]);
  config.scale_in_legs =
      toLegCount("BOT_CONFIG legs", parseInt("BOT_CONFIG legs", parts[5]));
  config.scale_in_drop_step = parseDouble("BOT_CONFIG step", parts[6]);

  config.max_usd_position =
      config.enable_scale_in
          ? config.usd_position_size * std::max(config.scale_in_legs, 1)
          : config.usd_position_size;
}

// -----------------------------------------------------------------------------
// load(): file → environment → validate
// -----------------------------------------------------------------------------
HedgeConfig ConfigLoader::load(const std::string& path, const EnvLookup& env) {
  HedgeConfig config = path.empty() ? HedgeConfig{} : fromFile(path);
  applyEnvironment(config, env);
  config.validate();
  return config;
}

}  // namespace hedge
