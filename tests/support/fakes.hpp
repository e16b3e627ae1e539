#pragma once

// =============================================================================
// fakes.hpp
// =============================================================================
// Test doubles shared by the hedge test suites.
//
//   ScriptedPriceSource  — per-symbol price script; the last value repeats
//   FlakyExchange        — wraps an IExchangeClient and injects failures per
//                          method (get_position / get_order_status)
//   makeConfig()         — a valid HedgeConfig with fast retry settings
// =============================================================================

#include "hedge/config/hedge_config.hpp"
#include "hedge/exchange/i_exchange_client.hpp"
#include "hedge/exchange/i_price_source.hpp"

#include <deque>
#include <map>
#include <string>

namespace hedge::test {

class ScriptedPriceSource final : public IPriceSource {
 public:
  // Replaces the script for `symbol` with a single sticky price.
  void set(const std::string& symbol, double price) {
    scripts_[symbol] = {domain::Result<double>(price)};
  }

  // Appends one step; once the script runs down to its last step, that step
  // repeats.
  void push(const std::string& symbol, double price) {
    scripts_[symbol].push_back(domain::Result<double>(price));
  }

  void pushError(const std::string& symbol, domain::ErrorCode code) {
    scripts_[symbol].push_back(
        domain::Result<double>(domain::CollaboratorError{code, "scripted"}));
  }

  // Makes the next `count` calls for `symbol` fail, then continues the
  // script.
  void failNext(const std::string& symbol, int count, domain::ErrorCode code) {
    auto& script = scripts_[symbol];
    for (int i = 0; i < count; ++i) {
      script.push_front(
          domain::Result<double>(domain::CollaboratorError{code, "scripted"}));
    }
  }

  domain::Result<double> get_mark_price(const std::string& symbol) override {
    ++calls_[symbol];
    auto it = scripts_.find(symbol);
    if (it == scripts_.end() || it->second.empty()) {
      return domain::CollaboratorError{domain::ErrorCode::Unavailable,
                                       "no script for " + symbol};
    }
    auto& script = it->second;
    domain::Result<double> value = script.front();
    if (script.size() > 1) {
      script.pop_front();
    }
    return value;
  }

  int calls(const std::string& symbol) const {
    auto it = calls_.find(symbol);
    return it == calls_.end() ? 0 : it->second;
  }

 private:
  std::map<std::string, std::deque<domain::Result<double>>> scripts_;
  std::map<std::string, int> calls_;
};

class FlakyExchange final : public IExchangeClient {
 public:
  explicit FlakyExchange(IExchangeClient& inner) : inner_(inner) {}

  void failPositions(int count, domain::ErrorCode code) {
    position_failures_ = count;
    position_code_ = code;
  }

  void failStatus(int count, domain::ErrorCode code) {
    status_failures_ = count;
    status_code_ = code;
  }

  domain::Result<domain::OrderResult> place_order(
      const domain::OrderRequest& request) override {
    return inner_.place_order(request);
  }

  domain::Result<domain::ExchangePosition> get_position(
      const std::string& symbol) override {
    ++position_calls_;
    if (position_failures_ > 0) {
      --position_failures_;
      return domain::CollaboratorError{position_code_, "scripted"};
    }
    return inner_.get_position(symbol);
  }

  domain::Result<std::optional<domain::OrderResult>> get_order_status(
      const std::string& key) override {
    ++status_calls_;
    if (status_failures_ > 0) {
      --status_failures_;
      return domain::CollaboratorError{status_code_, "scripted"};
    }
    return inner_.get_order_status(key);
  }

  int positionCalls() const { return position_calls_; }
  int statusCalls() const { return status_calls_; }

 private:
  IExchangeClient& inner_;
  int position_failures_{0};
  domain::ErrorCode position_code_{domain::ErrorCode::Unavailable};
  int status_failures_{0};
  domain::ErrorCode status_code_{domain::ErrorCode::Unavailable};
  int position_calls_{0};
  int status_calls_{0};
};

inline HedgeConfig makeConfig() {
  HedgeConfig config;
  config.symbol_long = "HYPEUSDT";
  config.symbol_short = "JASMYUSDT";
  config.usd_position_size = 1500.0;
  config.max_usd_position = 1500.0;
  config.trigger_drop_pct = 12.0;
  config.poll_interval_ms = 30000;
  config.retry_max_attempts = 3;
  config.retry_initial_backoff_ms = 100;
  config.retry_max_backoff_ms = 1000;
  config.retry_backoff_multiplier = 2.0;
  return config;
}

inline HedgeConfig makeScaleInConfig() {
  HedgeConfig config = makeConfig();
  config.trigger_drop_pct = 8.0;
  config.enable_scale_in = true;
  config.scale_in_legs = 3;
  config.scale_in_drop_step = 2.0;
  config.max_usd_position = 4500.0;
  return config;
}

}  // namespace hedge::test
