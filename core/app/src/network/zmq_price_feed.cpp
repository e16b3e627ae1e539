#include "hedge/network/zmq_price_feed.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <utility>

namespace hedge {

using domain::CollaboratorError;
using domain::ErrorCode;

ZmqPriceFeed::ZmqPriceFeed(const ITimeProvider& time, std::string endpoint,
                           std::int64_t stale_after_ms)
    : time_(time),
      endpoint_(std::move(endpoint)),
      stale_after_ms_(stale_after_ms) {}

ZmqPriceFeed::~ZmqPriceFeed() { stop(); }

// -----------------------------------------------------------------------------
// start(): SUB socket with a receive timeout, then the receive thread
// -----------------------------------------------------------------------------
void ZmqPriceFeed::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);

  // Empty filter: accept every symbol the publisher sends.
  socket_->set(zmq::sockopt::subscribe, "");
  // Without a timeout recv() would block forever and stop() would hang.
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ZmqPriceFeed] subscribed to " << endpoint_ << "\n";
}

void ZmqPriceFeed::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[ZmqPriceFeed] stopped.\n";
  }
  socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// run(): receive loop on the feed thread
// -----------------------------------------------------------------------------
void ZmqPriceFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[ZmqPriceFeed] recv failed: " << e.what() << "\n";
      running_.store(false);
      break;
    }

    if (!result.has_value()) {
      continue;  // timeout: re-check running_
    }

    onMessage(msg.to_string());
  }
}

// -----------------------------------------------------------------------------
// onMessage(): parse and cache
// -----------------------------------------------------------------------------
bool ZmqPriceFeed::onMessage(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    std::string symbol = json.at("symbol").get<std::string>();
    double price = json.at("price").get<double>();

    if (symbol.empty() || !std::isfinite(price) || price <= 0.0) {
      std::cerr << "[ZmqPriceFeed] dropping invalid tick: " << payload << "\n";
      return false;
    }

    std::lock_guard lock(quotes_mutex_);
    quotes_[symbol] = Quote{price, time_.now_ms()};
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqPriceFeed] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }
}

// -----------------------------------------------------------------------------
// get_mark_price(): cached, freshness-checked
// -----------------------------------------------------------------------------
domain::Result<double> ZmqPriceFeed::get_mark_price(const std::string& symbol) {
  std::lock_guard lock(quotes_mutex_);

  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return CollaboratorError{ErrorCode::Unavailable,
                             "no price received for " + symbol};
  }

  std::int64_t age = time_.now_ms() - it->second.received_at_ms;
  if (age > stale_after_ms_) {
    return CollaboratorError{ErrorCode::Unavailable,
                             "price for " + symbol + " is " +
                                 std::to_string(age) + " ms old"};
  }
  return it->second.price;
}

}  // namespace hedge
