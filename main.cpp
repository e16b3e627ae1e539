// -----------------------------------------------------------------------------
// hedge_engine — single executable entry point.
//
// Paper-trading run of the two-symbol hedge:
//   1) Load and validate the configuration (JSON file from argv[1] or
//      HEDGE_CONFIG, then environment overrides, then BOT_CONFIG). An
//      invalid configuration exits with status 1 before anything starts.
//   2) Create the wall clock and the EventBus, and subscribe console
//      logging for the events an operator cares about.
//   3) Start the ZeroMQ price feed (SUB) and the paper exchange on top of it.
//   4) Create the ControlLoop and, if configured, the IpcServer that exposes
//      its command handler and forwards telemetry.
//   5) Run the loop on the main thread until SIGINT/SIGTERM.
//   6) Shut down: the loop finishes its in-flight call, then the IPC server
//      and the feed are stopped and joined.
//
// Thread layout:
//   main thread   → ControlLoop::run()
//   feed thread   → ZmqPriceFeed receive loop
//   ipc thread    → IpcServer command/telemetry loop
// -----------------------------------------------------------------------------

#include "hedge/config/config_loader.hpp"
#include "hedge/engine/control_loop.hpp"
#include "hedge/eventbus/event_bus.hpp"
#include "hedge/exchange/paper_exchange_client.hpp"
#include "hedge/network/ipc_server.hpp"
#include "hedge/network/zmq_price_feed.hpp"
#include "hedge/time/live_time_provider.hpp"

#include <csignal>
#include <iostream>
#include <memory>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access.
// The only global in the program: a raw pointer to the stack-local loop, set
// once before signals are installed, so the handler can request a stop.
// -----------------------------------------------------------------------------
static hedge::ControlLoop* g_loop_ptr = nullptr;

// -----------------------------------------------------------------------------
// shutdown_handler
// -----------------------------------------------------------------------------
// stop() is a single atomic store. The loop sees it between collaborator
// calls or within one sleep slice, so an order in flight is never abandoned
// half way.
// -----------------------------------------------------------------------------
static void shutdown_handler(int /*signum*/) {
  if (g_loop_ptr != nullptr) {
    g_loop_ptr->stop();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  auto env = hedge::ConfigLoader::processEnvironment();
  std::string config_path;
  if (argc > 1) {
    config_path = argv[1];
  } else if (auto from_env = env("HEDGE_CONFIG")) {
    config_path = *from_env;
  }

  hedge::HedgeConfig config;
  try {
    config = hedge::ConfigLoader::load(config_path, env);
  } catch (const hedge::ConfigInvalid& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and EventBus with console logging.
  // -------------------------------------------------------------------------
  hedge::LiveTimeProvider clock;
  hedge::EventBus bus;

  bus.subscribe<hedge::OrderFilledEvent>([](const hedge::OrderFilledEvent& e) {
    std::cout << "[Fill] " << e.request.idempotency_key << " $"
              << e.result.filled_notional_usd << " @ " << e.result.avg_price
              << "\n";
  });
  bus.subscribe<hedge::CapReachedEvent>([](const hedge::CapReachedEvent& e) {
    std::cout << "[Cap] " << hedge::domain::toString(e.side) << " "
              << e.symbol << " capped at $" << e.total_notional_usd << " ("
              << e.legs_filled << " legs)\n";
  });
  bus.subscribe<hedge::ReconciliationMismatchEvent>(
      [](const hedge::ReconciliationMismatchEvent& e) {
        std::cerr << "[Reconcile] " << e.symbol << " memory $"
                  << e.memory_notional_usd << " exchange $"
                  << e.exchange_notional_usd << " (" << e.detail << ")\n";
      });
  bus.subscribe<hedge::PositionUpdateEvent>(
      [](const hedge::PositionUpdateEvent& e) {
        std::cout << "[Position] " << hedge::domain::toString(e.position.side)
                  << " " << e.position.symbol << " "
                  << hedge::domain::toString(e.position.state) << " $"
                  << e.position.total_notional_usd << " legs="
                  << e.position.legs_filled << "\n";
      });

  // -------------------------------------------------------------------------
  // 3) Collaborators.
  // -------------------------------------------------------------------------
  hedge::ZmqPriceFeed feed(clock, config.market_data_endpoint,
                           config.price_stale_ms);
  if (config.market_data_endpoint.empty()) {
    std::cerr << "[main] no market_data_endpoint configured; every price "
                 "read will be Unavailable\n";
  } else {
    feed.start();
  }

  hedge::PaperExchangeClient exchange(feed, config.call_timeout_ms);

  // -------------------------------------------------------------------------
  // 4) Control loop and IPC.
  // -------------------------------------------------------------------------
  hedge::ControlLoop loop(config, feed, exchange, clock, bus);

  std::unique_ptr<hedge::IpcServer> ipc;
  if (!config.ipc_cmd_endpoint.empty() && !config.ipc_pub_endpoint.empty()) {
    ipc = std::make_unique<hedge::IpcServer>(
        [&loop](const std::string& cmd) { return loop.executeCommand(cmd); },
        config.ipc_cmd_endpoint, config.ipc_pub_endpoint);
    bus.subscribe([&ipc](const hedge::Event& e) { ipc->pushTelemetry(e); });
    ipc->start();
  }

  // -------------------------------------------------------------------------
  // 5) Signals, then run on this thread until stopped.
  // -------------------------------------------------------------------------
  g_loop_ptr = &loop;
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] polling every " << config.poll_interval_ms
            << " ms. Press Ctrl-C to shut down.\n";
  loop.run();

  // -------------------------------------------------------------------------
  // 6) Clean shutdown.
  // -------------------------------------------------------------------------
  std::cout << "[main] loop exited. Stopping I/O threads...\n";
  if (ipc) {
    ipc->stop();
  }
  feed.stop();
  g_loop_ptr = nullptr;

  return 0;
}
