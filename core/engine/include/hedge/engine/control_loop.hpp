#pragma once

#include "hedge/concurrent/thread_safe_queue.hpp"
#include "hedge/config/hedge_config.hpp"
#include "hedge/domain/collaborator_error.hpp"
#include "hedge/domain/position.hpp"
#include "hedge/eventbus/event_bus.hpp"
#include "hedge/exchange/i_exchange_client.hpp"
#include "hedge/exchange/i_price_source.hpp"
#include "hedge/state/hedge_state_machine.hpp"
#include "hedge/time/i_time_provider.hpp"
#include "hedge/trigger/trigger_tracker.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hedge {

// -----------------------------------------------------------------------------
// ControlCommand — operator instruction queued for the loop thread
// -----------------------------------------------------------------------------
enum class CommandType {
  Close,   // external close signal
  Resume,  // clear a halt and re-reconcile
  Halt,    // stop issuing orders
};

struct ControlCommand {
  CommandType type{CommandType::Halt};
  std::vector<domain::HedgeSide> sides;  // Sides the command applies to
};

// -------------------------------------------------------------------------
// parseCommand(text)
// -------------------------------------------------------------------------
// @brief  Parses "CLOSE LONG|SHORT|ALL", "RESUME LONG|SHORT|ALL" or "HALT"
//         (case-insensitive).
//
// @return The command, or std::nullopt with `error` describing the problem.
// -------------------------------------------------------------------------
std::optional<ControlCommand> parseCommand(const std::string& text,
                                           std::string& error);

// -----------------------------------------------------------------------------
// RetryPolicy — exponential backoff for one collaborator call
// -----------------------------------------------------------------------------
// delay after failed attempt n (1-based) =
//   min(max_backoff_ms, initial_backoff_ms * multiplier^(n-1))
// No delay follows the last attempt.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{5};
  std::int64_t initial_backoff_ms{500};
  std::int64_t max_backoff_ms{10000};
  double multiplier{2.0};

  static RetryPolicy fromConfig(const HedgeConfig& config);

  std::int64_t backoffAfterAttempt(int attempt) const;
};

// -----------------------------------------------------------------------------
// SideStatus — thread-safe copy of one side for STATUS replies
// -----------------------------------------------------------------------------
struct SideStatus {
  domain::Position position;
  double anchor_price{0.0};
  double last_price{0.0};
  double drawdown_pct{0.0};
  bool reconciled{false};
  bool close_requested{false};  // CLOSE waiting for an in-flight order
};

// -----------------------------------------------------------------------------
// ControlLoop
// -----------------------------------------------------------------------------
//
// @brief  Drives the hedge: one tick per poll interval, both sides processed
//         sequentially, every collaborator call wrapped in retry/backoff.
//
// @details
// Per tick (runOnce):
//   0. Drain operator commands queued by executeCommand().
//   1. For LONG, then SHORT, inside its own try/catch:
//      a. skip if halted, unless a close is pending or deferred on it;
//      b. reconcile from get_position() if not yet reconciled;
//      c. resolve a pending order with get_order_status(): apply a known
//         result, re-place the SAME request if the exchange never saw it;
//      d. issue a CLOSE that was deferred behind that order;
//      e. read the trigger price (mark price, or long/short ratio), feed the
//         state machine, place the resulting order.
//   2. Publish a fresh status snapshot.
//
// Failure policy:
//   Transient errors retry with exponential backoff up to max_attempts, then
//   the side is abandoned for this tick (an unconfirmed order stays pending
//   and is resolved by key next tick). Rejected / InsufficientMargin halt
//   the side through the state machine; any other terminal error halts the
//   side directly. A terminal mark-price error halts every side whose
//   trigger reads that symbol. Nothing on one side stops the other side's
//   processing.
//
// A halted side still accepts CLOSE: the close goes out, and a fill that
// returns the side to FLAT clears the halt.
//
// Thread model:
//   start(), run(), runOnce() run on one thread (the loop thread).
//   stop(), executeCommand() and status() are safe from any thread: stop is
//   an atomic flag, commands go through a ThreadSafeQueue, and status reads
//   a snapshot guarded by a shared_mutex.
//
// Shutdown:
//   stop() is observed between collaborator calls and between sleep slices,
//   never in the middle of a call, so an order's outcome is always known
//   (or left pending for reconciliation) when run() returns.
//
// Ownership:
//   Owns the TriggerTracker and HedgeStateMachine. Holds references to the
//   collaborators, the time provider and the EventBus; main() or the test
//   owns those and must keep them alive longer than the loop.
// -----------------------------------------------------------------------------
class ControlLoop {
 public:
  ControlLoop(const HedgeConfig& config, IPriceSource& prices,
              IExchangeClient& exchange, ITimeProvider& time, EventBus& bus);

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Startup reconciliation of both sides against the exchange.
  //
  // @details
  // Best effort: a side whose get_position() keeps failing stays
  // unreconciled and is retried at the top of every tick. No side triggers
  // before it has been reconciled.
  // -------------------------------------------------------------------------
  void start();

  // Blocking loop: runOnce() then a sliced poll-interval sleep, until stop().
  void run();

  void runOnce();

  void stop();
  bool stopRequested() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC entry point. Returns a JSON reply.
  //
  // @details
  //   "PING"                   → {"status":"ok","response":"PONG"}
  //   "STATUS"                 → {"status":"ok","ticks":n,"sides":[...]}
  //   "CLOSE LONG|SHORT|ALL"   → {"status":"ok","response":"queued"}
  //   "RESUME LONG|SHORT|ALL"  → {"status":"ok","response":"queued"}
  //   "HALT"                   → {"status":"ok","response":"queued"}
  //   anything else            → {"status":"error","response":"..."}
  //
  // Thread-safety: Safe from any thread. Mutating commands are applied by
  //                the loop thread at the start of the next tick.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  void submit(ControlCommand command);

  SideStatus status(domain::HedgeSide side) const;

  std::uint64_t ticks() const { return ticks_.load(); }

  // Loop-thread only.
  const HedgeStateMachine& machine() const { return machine_; }
  const TriggerTracker& tracker() const { return tracker_; }

  // Longest single sleep, so stop() is noticed within this bound.
  static constexpr std::int64_t kSleepSliceMs = 100;

 private:
  struct SideRuntime {
    bool reconciled{false};
    bool close_requested{false};  // CLOSE deferred behind a pending order
  };

  // -------------------------------------------------------------------------
  // withRetry(operation, target, call)
  // -------------------------------------------------------------------------
  // Calls `call` until it succeeds, fails terminally, exhausts the retry
  // budget, or a stop is requested. Sleeps through the time provider
  // between attempts and publishes a CollaboratorFailureEvent per failure.
  // Returns the last result.
  // -------------------------------------------------------------------------
  template <typename T>
  domain::Result<T> withRetry(const std::string& operation,
                              const std::string& target,
                              const std::function<domain::Result<T>()>& call);

  void applyCommands();
  void processSide(domain::HedgeSide side);
  bool reconcile(domain::HedgeSide side);
  void resolvePending(domain::HedgeSide side);
  void placeRequest(domain::HedgeSide side,
                    const domain::OrderRequest& request);
  void handleOrderError(domain::HedgeSide side,
                        const domain::OrderRequest& request,
                        const domain::CollaboratorError& error);
  std::optional<double> fetchPrice(const std::string& symbol);
  std::optional<double> triggerPrice(domain::HedgeSide side);
  void haltReaders(const std::string& symbol,
                   const domain::CollaboratorError& error);
  void closeSide(domain::HedgeSide side);
  void publishSnapshot();
  void sleepInterruptibly(std::int64_t duration_ms);

  SideRuntime& runtime(domain::HedgeSide side);

  HedgeConfig config_;
  IPriceSource& prices_;
  IExchangeClient& exchange_;
  ITimeProvider& time_;
  EventBus& bus_;
  RetryPolicy retry_;

  TriggerTracker tracker_;
  HedgeStateMachine machine_;

  std::array<SideRuntime, 2> runtime_;
  std::unordered_map<std::string, std::optional<double>> tick_prices_;

  ThreadSafeQueue<ControlCommand> commands_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> ticks_{0};
  bool started_{false};

  mutable std::shared_mutex status_mutex_;  // Protects status_
  std::array<SideStatus, 2> status_;
};

}  // namespace hedge
