#pragma once

#include "hedge/exchange/i_price_source.hpp"
#include "hedge/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace hedge {

// -----------------------------------------------------------------------------
// ZmqPriceFeed — IPriceSource backed by a ZeroMQ SUB socket
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a background thread and serves the latest
//         price per symbol to the control loop.
//
// @details
// Wire format (one message per tick):
//   {"symbol": "HYPEUSDT", "price": 24.81, "timestamp_ms": 1718000000000}
// timestamp_ms is optional and informational; freshness is measured from the
// local receipt time so a skewed publisher clock cannot make a price look
// fresh.
//
// get_mark_price() never blocks on the network: it reads the cache and
// returns ErrorCode::Unavailable when the symbol has no price yet or its
// last price is older than stale_after_ms.
//
// Malformed messages are logged and dropped.
//
// Thread model:
//   start() spawns the receive thread; stop() (or the destructor) joins it.
//   The recv timeout bounds how long stop() waits. The cache is protected by
//   a mutex; get_mark_price() is safe from any thread.
//
// Ownership:
//   Owns its ZMQ context, socket and thread. Holds a reference to the time
//   provider used to stamp receipts.
// -----------------------------------------------------------------------------
class ZmqPriceFeed final : public IPriceSource {
 public:
  ZmqPriceFeed(const ITimeProvider& time, std::string endpoint,
               std::int64_t stale_after_ms);

  ~ZmqPriceFeed() override;

  ZmqPriceFeed(const ZmqPriceFeed&) = delete;
  ZmqPriceFeed& operator=(const ZmqPriceFeed&) = delete;
  ZmqPriceFeed(ZmqPriceFeed&&) = delete;
  ZmqPriceFeed& operator=(ZmqPriceFeed&&) = delete;

  // Opens the SUB socket and starts the receive thread. Idempotent.
  void start();

  void stop();

  domain::Result<double> get_mark_price(const std::string& symbol) override;

  // -------------------------------------------------------------------------
  // onMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Parses one tick and updates the cache.
  //
  // @return false if the payload was malformed and dropped.
  //
  // Called by the receive thread; public so tests can feed payloads without
  // a socket.
  // -------------------------------------------------------------------------
  bool onMessage(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  struct Quote {
    double price{0.0};
    std::int64_t received_at_ms{0};
  };

  void run();

  const ITimeProvider& time_;
  std::string endpoint_;
  std::int64_t stale_after_ms_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::mutex quotes_mutex_;  // Protects quotes_
  std::unordered_map<std::string, Quote> quotes_;
};

}  // namespace hedge
