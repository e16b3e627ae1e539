#pragma once

#include "hedge/concurrent/thread_safe_queue.hpp"
#include "hedge/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace hedge {

// -----------------------------------------------------------------------------
// IpcServer — operator commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  Two ZeroMQ sockets on one worker thread:
//           REP  commands ("PING", "STATUS", "CLOSE LONG", ...) answered by
//                the CommandHandler (ControlLoop::executeCommand)
//           PUB  one JSON line per telemetry event
//
// @details
// The control loop never touches a socket. Its EventBus subscribers call
// pushTelemetry(), which only enqueues; the worker thread drains the queue
// and publishes. Commands are answered on the worker thread; the handler is
// responsible for its own thread safety.
//
// Worker loop: drain telemetry, then wait up to kPollTimeoutMs for a
// command. The timeout bounds both telemetry latency and stop() latency.
//
// Ownership:
//   Owns the context, both sockets, the queue and the thread. Sockets are
//   created in start(), not in the constructor, so a server that is never
//   started binds nothing.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();

  // Signals the worker, joins it after a final telemetry drain, closes the
  // sockets. Idempotent.
  void stop();

  // Thread-safe. Called from EventBus subscribers on the control loop thread.
  // Never blocks: past kTelemetryCapacity queued events the oldest is dropped.
  void pushTelemetry(Event event);

  std::size_t droppedTelemetry() const { return telemetry_queue_.dropped(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON line published for this event, or std::nullopt for
  //         event kinds that are not published (per-tick price readings).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryCapacity = 4096;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace hedge
