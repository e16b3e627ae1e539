// =============================================================================
// network_test.cpp
// =============================================================================
// Unit tests for the ZeroMQ-facing components, without opening sockets.
//
// Validates:
//   - ZmqPriceFeed::onMessage: valid ticks cached, malformed ones dropped
//   - get_mark_price: Unavailable before the first tick and once stale
//   - IpcServer::formatTelemetry: one JSON object per event kind, price
//     observations filtered out
// =============================================================================

#include "hedge/network/ipc_server.hpp"
#include "hedge/network/zmq_price_feed.hpp"
#include "hedge/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using hedge::domain::CollaboratorError;
using hedge::domain::ErrorCode;
using hedge::domain::HedgeSide;
using hedge::domain::PositionState;

class ZmqPriceFeedTest : public ::testing::Test {
 protected:
  hedge::SimulationTimeProvider clock{10'000};
  hedge::ZmqPriceFeed feed{clock, "tcp://127.0.0.1:5555", 60'000};
};

// -----------------------------------------------------------------------------
// 1. A well-formed tick is cached and served.
// -----------------------------------------------------------------------------
TEST_F(ZmqPriceFeedTest, ValidTickIsServed) {
  EXPECT_TRUE(feed.onMessage(R"({"symbol":"HYPEUSDT","price":42.5})"));

  auto price = feed.get_mark_price("HYPEUSDT");
  ASSERT_TRUE(std::holds_alternative<double>(price));
  EXPECT_DOUBLE_EQ(std::get<double>(price), 42.5);
}

// -----------------------------------------------------------------------------
// 2. Before any tick for a symbol the price is Unavailable (transient).
// -----------------------------------------------------------------------------
TEST_F(ZmqPriceFeedTest, UnknownSymbolIsUnavailable) {
  auto price = feed.get_mark_price("JASMYUSDT");
  const auto* err = std::get_if<CollaboratorError>(&price);
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, ErrorCode::Unavailable);
  EXPECT_TRUE(hedge::domain::isTransient(err->code));
}

// -----------------------------------------------------------------------------
// 3. A quote older than the staleness limit is not used.
// Why: Triggering on a frozen feed would open a position on a price the
//      market left long ago.
// -----------------------------------------------------------------------------
TEST_F(ZmqPriceFeedTest, StaleQuoteIsUnavailable) {
  feed.onMessage(R"({"symbol":"HYPEUSDT","price":42.5})");

  clock.advance_time(10'000 + 60'000);
  EXPECT_TRUE(std::holds_alternative<double>(feed.get_mark_price("HYPEUSDT")));

  clock.advance_time(10'000 + 60'001);
  auto stale = feed.get_mark_price("HYPEUSDT");
  ASSERT_TRUE(std::holds_alternative<CollaboratorError>(stale));
  EXPECT_EQ(std::get<CollaboratorError>(stale).code, ErrorCode::Unavailable);

  // A fresh tick revives it.
  feed.onMessage(R"({"symbol":"HYPEUSDT","price":41.0})");
  EXPECT_DOUBLE_EQ(std::get<double>(feed.get_mark_price("HYPEUSDT")), 41.0);
}

// -----------------------------------------------------------------------------
// 4. Malformed or invalid ticks are dropped and do not overwrite the cache.
// -----------------------------------------------------------------------------
TEST_F(ZmqPriceFeedTest, InvalidTicksAreDropped) {
  feed.onMessage(R"({"symbol":"HYPEUSDT","price":42.5})");

  EXPECT_FALSE(feed.onMessage("not json"));
  EXPECT_FALSE(feed.onMessage(R"({"symbol":"HYPEUSDT"})"));
  EXPECT_FALSE(feed.onMessage(R"({"symbol":"HYPEUSDT","price":"high"})"));
  EXPECT_FALSE(feed.onMessage(R"({"symbol":"HYPEUSDT","price":-1})"));
  EXPECT_FALSE(feed.onMessage(R"({"symbol":"","price":10})"));

  EXPECT_DOUBLE_EQ(std::get<double>(feed.get_mark_price("HYPEUSDT")), 42.5);
}

// =============================================================================
// IpcServer::formatTelemetry
// =============================================================================

// -----------------------------------------------------------------------------
// 5. Per-tick price observations are not published.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, PriceObservationsAreFiltered) {
  hedge::PriceObservedEvent observed;
  observed.symbol = "HYPEUSDT";
  observed.price = 90.0;
  EXPECT_FALSE(hedge::IpcServer::formatTelemetry(observed).has_value());
}

// -----------------------------------------------------------------------------
// 6. Fills carry the order key and execution details.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, OrderFilledJson) {
  hedge::OrderFilledEvent filled;
  filled.side = HedgeSide::Long;
  filled.request.idempotency_key = "HYPEUSDT-L0-E7";
  filled.request.symbol = "HYPEUSDT";
  filled.request.notional_usd = 1500.0;
  filled.result.idempotency_key = "HYPEUSDT-L0-E7";
  filled.result.filled_notional_usd = 1500.0;
  filled.result.avg_price = 87.0;
  filled.timestamp_ms = 7;

  auto text = hedge::IpcServer::formatTelemetry(filled);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);

  EXPECT_EQ(j["type"], "order_filled");
  EXPECT_EQ(j["side"], "LONG");
  EXPECT_EQ(j["order"]["key"], "HYPEUSDT-L0-E7");
  EXPECT_EQ(j["order"]["purpose"], "Open");
  EXPECT_DOUBLE_EQ(j["filled_notional_usd"].get<double>(), 1500.0);
  EXPECT_DOUBLE_EQ(j["avg_price"].get<double>(), 87.0);
  EXPECT_EQ(j["timestamp_ms"], 7);
}

TEST(IpcTelemetryTest, StateTransitionJson) {
  hedge::StateTransitionEvent transition;
  transition.side = HedgeSide::Short;
  transition.symbol = "JASMYUSDT";
  transition.from = PositionState::Entered;
  transition.to = PositionState::Capped;
  transition.reason = "cap reached";

  auto j = nlohmann::json::parse(
      *hedge::IpcServer::formatTelemetry(transition));
  EXPECT_EQ(j["type"], "state_transition");
  EXPECT_EQ(j["side"], "SHORT");
  EXPECT_EQ(j["from"], "ENTERED");
  EXPECT_EQ(j["to"], "CAPPED");
  EXPECT_EQ(j["reason"], "cap reached");
}

TEST(IpcTelemetryTest, CollaboratorFailureJson) {
  hedge::CollaboratorFailureEvent failure;
  failure.operation = "place_order";
  failure.target = "HYPEUSDT-L0-E7";
  failure.error = CollaboratorError{ErrorCode::RateLimited, "slow down"};
  failure.attempt = 2;
  failure.will_retry = true;

  auto j = nlohmann::json::parse(*hedge::IpcServer::formatTelemetry(failure));
  EXPECT_EQ(j["type"], "collaborator_failure");
  EXPECT_EQ(j["code"], "RateLimited");
  EXPECT_EQ(j["attempt"], 2);
  EXPECT_TRUE(j["will_retry"].get<bool>());
}

// -----------------------------------------------------------------------------
// 7. Every other event kind maps to its own type tag.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, EveryEventKindHasATypeTag) {
  struct Case {
    hedge::Event event;
    const char* type;
  };
  const Case cases[] = {
      {hedge::OrderSubmittedEvent{}, "order_submitted"},
      {hedge::CapReachedEvent{}, "cap_reached"},
      {hedge::SideHaltedEvent{}, "side_halted"},
      {hedge::PositionUpdateEvent{}, "position_update"},
      {hedge::ReconciliationMismatchEvent{}, "reconciliation_mismatch"},
  };

  for (const auto& c : cases) {
    auto text = hedge::IpcServer::formatTelemetry(c.event);
    ASSERT_TRUE(text.has_value()) << c.type;
    EXPECT_EQ(nlohmann::json::parse(*text)["type"], c.type);
  }
}
