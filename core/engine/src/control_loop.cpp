#include "hedge/engine/control_loop.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace hedge {

using domain::CollaboratorError;
using domain::ErrorCode;
using domain::HedgeSide;
using domain::OrderRequest;
using domain::OrderResult;
using domain::Result;

namespace {

constexpr std::array<HedgeSide, 2> kSides{HedgeSide::Long, HedgeSide::Short};

std::size_t indexOf(HedgeSide side) {
  return side == HedgeSide::Long ? 0 : 1;
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

std::optional<std::vector<HedgeSide>> parseSides(const std::string& token) {
  if (token == "LONG") return std::vector<HedgeSide>{HedgeSide::Long};
  if (token == "SHORT") return std::vector<HedgeSide>{HedgeSide::Short};
  if (token == "ALL") {
    return std::vector<HedgeSide>{HedgeSide::Long, HedgeSide::Short};
  }
  return std::nullopt;
}

nlohmann::json toJson(const SideStatus& s) {
  const domain::Position& pos = s.position;
  nlohmann::json j;
  j["side"] = domain::toString(pos.side);
  j["symbol"] = pos.symbol;
  j["state"] = domain::toString(pos.state);
  j["total_notional_usd"] = pos.total_notional_usd;
  j["legs_filled"] = pos.legs_filled;
  j["avg_entry_price"] = pos.avg_entry_price;
  j["anchor_price"] = s.anchor_price;
  j["last_price"] = s.last_price;
  j["drawdown_pct"] = s.drawdown_pct;
  j["halted"] = pos.halted;
  j["halt_reason"] = pos.halt_reason;
  j["reconciled"] = s.reconciled;
  j["close_requested"] = s.close_requested;
  if (pos.pending) {
    j["pending"] = pos.pending->idempotency_key;
  } else {
    j["pending"] = nullptr;
  }
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseCommand()
// -----------------------------------------------------------------------------
std::optional<ControlCommand> parseCommand(const std::string& text,
                                           std::string& error) {
  std::istringstream in(upper(text));
  std::string verb;
  std::string target;
  std::string extra;
  in >> verb >> target >> extra;

  if (!extra.empty()) {
    error = "Too many arguments: " + text;
    return std::nullopt;
  }

  if (verb == "HALT" && target.empty()) {
    return ControlCommand{CommandType::Halt,
                          {HedgeSide::Long, HedgeSide::Short}};
  }

  if (verb == "CLOSE" || verb == "RESUME") {
    auto sides = parseSides(target);
    if (!sides) {
      error = verb + " expects LONG, SHORT or ALL";
      return std::nullopt;
    }
    CommandType type =
        verb == "CLOSE" ? CommandType::Close : CommandType::Resume;
    return ControlCommand{type, *sides};
  }

  error = "Unknown command: " + text;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------
RetryPolicy RetryPolicy::fromConfig(const HedgeConfig& config) {
  RetryPolicy policy;
  policy.max_attempts = config.retry_max_attempts;
  policy.initial_backoff_ms = config.retry_initial_backoff_ms;
  policy.max_backoff_ms = config.retry_max_backoff_ms;
  policy.multiplier = config.retry_backoff_multiplier;
  return policy;
}

std::int64_t RetryPolicy::backoffAfterAttempt(int attempt) const {
  if (attempt < 1) {
    return 0;
  }
  double delay = static_cast<double>(initial_backoff_ms) *
                 std::pow(multiplier, attempt - 1);
  if (delay >= static_cast<double>(max_backoff_ms)) {
    return max_backoff_ms;
  }
  return static_cast<std::int64_t>(delay);
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ControlLoop::ControlLoop(const HedgeConfig& config, IPriceSource& prices,
                         IExchangeClient& exchange, ITimeProvider& time,
                         EventBus& bus)
    : config_(config),
      prices_(prices),
      exchange_(exchange),
      time_(time),
      bus_(bus),
      retry_(RetryPolicy::fromConfig(config)),
      machine_(config, tracker_, bus) {
  publishSnapshot();
}

ControlLoop::SideRuntime& ControlLoop::runtime(HedgeSide side) {
  return runtime_[indexOf(side)];
}

// -----------------------------------------------------------------------------
// withRetry(): bounded exponential backoff
// -----------------------------------------------------------------------------
template <typename T>
Result<T> ControlLoop::withRetry(const std::string& operation,
                                 const std::string& target,
                                 const std::function<Result<T>()>& call) {
  Result<T> result = call();

  for (int attempt = 1;; ++attempt) {
    const auto* err = std::get_if<CollaboratorError>(&result);
    if (err == nullptr) {
      return result;
    }

    const bool transient = domain::isTransient(err->code);
    const bool will_retry = transient && attempt < retry_.max_attempts &&
                            !stop_requested_.load();

    CollaboratorFailureEvent failure;
    failure.operation = operation;
    failure.target = target;
    failure.error = *err;
    failure.attempt = attempt;
    failure.will_retry = will_retry;
    failure.timestamp_ms = time_.now_ms();
    bus_.publish(failure);

    if (!will_retry) {
      std::cerr << "[ControlLoop] " << operation << "(" << target
                << ") failed after " << attempt << " attempt(s): "
                << domain::toString(err->code) << " " << err->message << "\n";
      return result;
    }

    time_.sleep_for_ms(retry_.backoffAfterAttempt(attempt));
    result = call();
  }
}

// -----------------------------------------------------------------------------
// start(): startup reconciliation
// -----------------------------------------------------------------------------
void ControlLoop::start() {
  if (started_) {
    return;
  }
  started_ = true;

  std::cout << "[ControlLoop] starting: " << config_.symbol_long << " (long) / "
            << config_.symbol_short << " (short), trigger "
            << config_.trigger_drop_pct << "%, leg $"
            << config_.usd_position_size << ", cap $"
            << config_.max_usd_position << " (" << toString(config_.cap_mode)
            << ")\n";

  for (HedgeSide side : kSides) {
    try {
      reconcile(side);
    } catch (const std::exception& e) {
      std::cerr << "[ControlLoop] reconciliation of "
                << domain::toString(side) << " threw: " << e.what() << "\n";
    }
  }
  publishSnapshot();
}

// -----------------------------------------------------------------------------
// run(): tick, sleep, repeat
// -----------------------------------------------------------------------------
void ControlLoop::run() {
  start();
  while (!stop_requested_.load()) {
    runOnce();
    sleepInterruptibly(config_.poll_interval_ms);
  }
  std::cout << "[ControlLoop] stopped after " << ticks_.load()
            << " tick(s).\n";
}

void ControlLoop::sleepInterruptibly(std::int64_t duration_ms) {
  std::int64_t remaining = duration_ms;
  while (remaining > 0 && !stop_requested_.load()) {
    std::int64_t slice = std::min(remaining, kSleepSliceMs);
    time_.sleep_for_ms(slice);
    remaining -= slice;
  }
}

void ControlLoop::stop() { stop_requested_.store(true); }

bool ControlLoop::stopRequested() const { return stop_requested_.load(); }

// -----------------------------------------------------------------------------
// runOnce(): one tick
// -----------------------------------------------------------------------------
void ControlLoop::runOnce() {
  applyCommands();
  tick_prices_.clear();

  for (HedgeSide side : kSides) {
    if (stop_requested_.load()) {
      break;
    }
    try {
      processSide(side);
    } catch (const std::exception& e) {
      // A bad tick on one side must not take down the other side or the
      // process. The state machine is left exactly as it was.
      std::cerr << "[ControlLoop] " << domain::toString(side)
                << " tick failed: " << e.what() << "\n";
    }
  }

  ++ticks_;
  publishSnapshot();
}

// -----------------------------------------------------------------------------
// processSide(): reconcile → resolve pending → trigger
// -----------------------------------------------------------------------------
void ControlLoop::processSide(HedgeSide side) {
  const domain::Position& pos = machine_.position(side);
  SideRuntime& rt = runtime(side);
  const bool closing =
      rt.close_requested ||
      (pos.pending && pos.pending->purpose == domain::OrderPurpose::Close);
  if (pos.halted && !closing) {
    return;
  }

  if (!rt.reconciled && !reconcile(side)) {
    return;
  }

  if (pos.pending) {
    resolvePending(side);
    if (pos.pending || stop_requested_.load()) {
      return;
    }
  }

  if (rt.close_requested) {
    closeSide(side);
    return;
  }

  if (pos.halted) {
    return;
  }

  std::optional<double> price = triggerPrice(side);
  if (!price) {
    return;
  }

  std::optional<OrderRequest> request =
      machine_.onPrice(side, *price, time_.now_ms());
  if (request) {
    placeRequest(side, *request);
  }
}

// -----------------------------------------------------------------------------
// reconcile(): exchange position → state machine
// -----------------------------------------------------------------------------
bool ControlLoop::reconcile(HedgeSide side) {
  const std::string& symbol = machine_.position(side).symbol;

  Result<domain::ExchangePosition> result =
      withRetry<domain::ExchangePosition>(
          "get_position", symbol,
          [this, &symbol] { return exchange_.get_position(symbol); });

  if (const auto* err = std::get_if<CollaboratorError>(&result)) {
    if (!domain::isTransient(err->code)) {
      machine_.halt(side,
                    std::string("reconciliation failed: ") +
                        domain::toString(err->code) + " " + err->message,
                    time_.now_ms());
    }
    return false;
  }

  machine_.hydrate(side, std::get<domain::ExchangePosition>(result),
                   time_.now_ms());
  runtime(side).reconciled = true;
  return true;
}

// -----------------------------------------------------------------------------
// resolvePending(): learn the outcome of an unconfirmed order
// -----------------------------------------------------------------------------
void ControlLoop::resolvePending(HedgeSide side) {
  const OrderRequest request = *machine_.position(side).pending;
  const std::string& key = request.idempotency_key;

  Result<std::optional<OrderResult>> status =
      withRetry<std::optional<OrderResult>>(
          "get_order_status", key,
          [this, &key] { return exchange_.get_order_status(key); });

  if (const auto* err = std::get_if<CollaboratorError>(&status)) {
    if (!domain::isTransient(err->code)) {
      handleOrderError(side, request, *err);
    }
    return;
  }

  const auto& known = std::get<std::optional<OrderResult>>(status);
  if (known) {
    std::cout << "[ControlLoop] resolved " << key << " from order status\n";
    machine_.onOrderResult(side, *known, time_.now_ms());
    return;
  }

  // The exchange never saw this key: safe to place it again, same key.
  std::cout << "[ControlLoop] re-placing unconfirmed order " << key << "\n";
  placeRequest(side, request);
}

// -----------------------------------------------------------------------------
// placeRequest(): submit with retry and apply the outcome
// -----------------------------------------------------------------------------
void ControlLoop::placeRequest(HedgeSide side, const OrderRequest& request) {
  OrderSubmittedEvent submitted;
  submitted.side = side;
  submitted.request = request;
  submitted.timestamp_ms = time_.now_ms();
  bus_.publish(submitted);

  std::cout << "[ControlLoop] placing " << request.idempotency_key << " "
            << domain::toString(request.purpose) << " "
            << domain::toString(request.side) << " $" << request.notional_usd
            << "\n";

  Result<OrderResult> result = withRetry<OrderResult>(
      "place_order", request.idempotency_key,
      [this, &request] { return exchange_.place_order(request); });

  if (const auto* err = std::get_if<CollaboratorError>(&result)) {
    if (domain::isTransient(err->code)) {
      std::cerr << "[ControlLoop] " << request.idempotency_key
                << " outcome unknown; resolving next tick\n";
      return;
    }
    handleOrderError(side, request, *err);
    return;
  }

  // A follow-up close for a remainder stays pending and goes out next tick.
  machine_.onOrderResult(side, std::get<OrderResult>(result), time_.now_ms());
}

void ControlLoop::handleOrderError(HedgeSide side, const OrderRequest& request,
                                   const CollaboratorError& error) {
  const std::int64_t now = time_.now_ms();
  if (error.code == ErrorCode::Rejected ||
      error.code == ErrorCode::InsufficientMargin) {
    machine_.onOrderRejected(side, request.idempotency_key,
                             std::string(domain::toString(error.code)) + ": " +
                                 error.message,
                             now);
    return;
  }
  machine_.halt(side,
                std::string(domain::toString(error.code)) + ": " +
                    error.message,
                now);
}

// -----------------------------------------------------------------------------
// Prices
// -----------------------------------------------------------------------------
std::optional<double> ControlLoop::fetchPrice(const std::string& symbol) {
  if (auto it = tick_prices_.find(symbol); it != tick_prices_.end()) {
    return it->second;
  }

  Result<double> result = withRetry<double>(
      "get_mark_price", symbol,
      [this, &symbol] { return prices_.get_mark_price(symbol); });

  std::optional<double> price;
  if (const auto* value = std::get_if<double>(&result)) {
    if (std::isfinite(*value) && *value > 0.0) {
      price = *value;
    } else {
      std::cerr << "[ControlLoop] ignoring invalid price " << *value
                << " for " << symbol << "\n";
    }
  }

  // Cached before halting so a second reader of the symbol neither calls
  // the source again nor triggers this tick.
  tick_prices_[symbol] = price;

  const auto* err = std::get_if<CollaboratorError>(&result);
  if (err != nullptr && !domain::isTransient(err->code)) {
    haltReaders(symbol, *err);
  }
  return price;
}

void ControlLoop::haltReaders(const std::string& symbol,
                              const CollaboratorError& error) {
  const std::string reason = "get_mark_price(" + symbol + ") failed: " +
                             domain::toString(error.code) + " " +
                             error.message;
  for (HedgeSide side : kSides) {
    const bool reads_symbol =
        config_.trigger_source == TriggerSource::Ratio ||
        machine_.position(side).symbol == symbol;
    if (reads_symbol) {
      machine_.halt(side, reason, time_.now_ms());
    }
  }
}

std::optional<double> ControlLoop::triggerPrice(HedgeSide side) {
  if (config_.trigger_source == TriggerSource::Symbol) {
    return fetchPrice(machine_.position(side).symbol);
  }

  std::optional<double> long_price = fetchPrice(config_.symbol_long);
  if (!long_price) {
    return std::nullopt;
  }
  std::optional<double> short_price = fetchPrice(config_.symbol_short);
  if (!short_price) {
    return std::nullopt;
  }
  return *long_price / *short_price;
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------
void ControlLoop::submit(ControlCommand command) {
  commands_.push(std::move(command));
}

void ControlLoop::applyCommands() {
  for (const ControlCommand& command : commands_.drain()) {
    for (HedgeSide side : command.sides) {
      try {
        switch (command.type) {
          case CommandType::Halt:
            machine_.halt(side, "operator HALT", time_.now_ms());
            break;

          case CommandType::Resume:
            machine_.resume(side, time_.now_ms());
            runtime(side).reconciled = false;
            break;

          case CommandType::Close:
            if (!runtime(side).reconciled && !reconcile(side)) {
              std::cerr << "[ControlLoop] close " << domain::toString(side)
                        << " deferred: not reconciled\n";
              runtime(side).close_requested = true;
              break;
            }
            if (machine_.position(side).pending) {
              std::cout << "[ControlLoop] close " << domain::toString(side)
                        << " deferred until "
                        << machine_.position(side).pending->idempotency_key
                        << " resolves\n";
              runtime(side).close_requested = true;
              break;
            }
            closeSide(side);
            break;
        }
      } catch (const std::exception& e) {
        std::cerr << "[ControlLoop] command on " << domain::toString(side)
                  << " failed: " << e.what() << "\n";
      }
    }
  }
}

void ControlLoop::closeSide(HedgeSide side) {
  runtime(side).close_requested = false;
  if (auto request = machine_.requestClose(side, time_.now_ms())) {
    placeRequest(side, *request);
  }
}

std::string ControlLoop::executeCommand(const std::string& cmd) {
  nlohmann::json response;
  const std::string normalized = upper(cmd);

  if (normalized == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (normalized == "STATUS") {
    nlohmann::json sides = nlohmann::json::array();
    {
      std::shared_lock lock(status_mutex_);
      for (const SideStatus& s : status_) {
        sides.push_back(toJson(s));
      }
    }
    response["status"] = "ok";
    response["ticks"] = ticks_.load();
    response["cap_mode"] = toString(config_.cap_mode);
    response["trigger_source"] = toString(config_.trigger_source);
    response["sides"] = std::move(sides);
  } else {
    std::string error;
    if (auto command = parseCommand(cmd, error)) {
      submit(std::move(*command));
      response["status"] = "ok";
      response["response"] = "queued";
    } else {
      response["status"] = "error";
      response["response"] = error;
    }
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Status snapshot
// -----------------------------------------------------------------------------
void ControlLoop::publishSnapshot() {
  std::array<SideStatus, 2> snapshot;
  for (HedgeSide side : kSides) {
    SideStatus& s = snapshot[indexOf(side)];
    s.position = machine_.position(side);
    s.reconciled = runtime(side).reconciled;
    s.close_requested = runtime(side).close_requested;
    if (auto ref = tracker_.reference(s.position.symbol)) {
      s.anchor_price = ref->anchor_price;
      s.last_price = ref->last_observed_price;
      s.drawdown_pct =
          TriggerTracker::drawdownPct(ref->anchor_price,
                                      ref->last_observed_price);
    }
  }

  std::unique_lock lock(status_mutex_);
  status_ = std::move(snapshot);
}

SideStatus ControlLoop::status(HedgeSide side) const {
  std::shared_lock lock(status_mutex_);
  return status_[indexOf(side)];
}

}  // namespace hedge
