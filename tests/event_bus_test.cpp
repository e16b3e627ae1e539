// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for hedge::EventBus.
//
// Validates:
//   - Generic subscription receives every hedge event type
//   - Typed subscription receives only the matching type
//   - Multiple subscribers all receive the same event
//   - Unsubscribe stops delivery; unknown ids are a no-op
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload integrity through the variant dispatch path
//   - A throwing subscriber is isolated from the others and the publisher
//
// All tests are single-threaded.
// =============================================================================

#include "hedge/eventbus/event_bus.hpp"
#include "hedge/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using hedge::domain::HedgeSide;
using hedge::domain::PositionState;

class EventBusTest : public ::testing::Test {
 protected:
  hedge::EventBus bus;

  static hedge::PriceObservedEvent makePrice(const std::string& symbol,
                                             double price) {
    hedge::PriceObservedEvent e;
    e.side = HedgeSide::Long;
    e.symbol = symbol;
    e.price = price;
    e.anchor_price = 100.0;
    e.drawdown_pct = 100.0 - price;
    return e;
  }

  static hedge::StateTransitionEvent makeTransition(PositionState from,
                                                    PositionState to) {
    hedge::StateTransitionEvent e;
    e.side = HedgeSide::Short;
    e.symbol = "JASMYUSDT";
    e.from = from;
    e.to = to;
    e.reason = "test";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// Why: The IPC telemetry bridge subscribes generically; a skipped type would
//      be missing from the operator's stream.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const hedge::Event&) { ++call_count; });

  bus.publish(makePrice("HYPEUSDT", 90.0));
  bus.publish(makeTransition(PositionState::Flat, PositionState::Entering));
  bus.publish(hedge::CapReachedEvent{HedgeSide::Long, "HYPEUSDT", 1500.0, 1,
                                     0});
  bus.publish(hedge::CollaboratorFailureEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int transitions = 0;
  bus.subscribe<hedge::StateTransitionEvent>(
      [&transitions](const hedge::StateTransitionEvent&) { ++transitions; });

  bus.publish(makePrice("HYPEUSDT", 90.0));
  bus.publish(makeTransition(PositionState::Flat, PositionState::Entering));
  bus.publish(hedge::SideHaltedEvent{});

  EXPECT_EQ(transitions, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<hedge::CapReachedEvent>(
      [&count_a](const hedge::CapReachedEvent&) { ++count_a; });
  bus.subscribe<hedge::CapReachedEvent>(
      [&count_b](const hedge::CapReachedEvent&) { ++count_b; });

  bus.publish(hedge::CapReachedEvent{});

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<hedge::PriceObservedEvent>(
      [&call_count](const hedge::PriceObservedEvent&) { ++call_count; });

  bus.publish(makePrice("HYPEUSDT", 99.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makePrice("HYPEUSDT", 98.0));
  EXPECT_EQ(call_count, 1);
}

TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makePrice("HYPEUSDT", 90.0)));
}

// -----------------------------------------------------------------------------
// 5. A subscriber that publishes inside its callback must not deadlock.
// Why: publish() copies the subscriber list and releases the lock before
//      invoking callbacks. Holding it would hang this test.
//
// Scenario: a CapReachedEvent handler halts the side by publishing a
//           SideHaltedEvent, which a second subscriber receives.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int halts = 0;

  bus.subscribe<hedge::SideHaltedEvent>(
      [&halts](const hedge::SideHaltedEvent&) { ++halts; });

  bus.subscribe<hedge::CapReachedEvent>(
      [this](const hedge::CapReachedEvent& cap) {
        hedge::SideHaltedEvent halted;
        halted.side = cap.side;
        halted.symbol = cap.symbol;
        halted.reason = "cap";
        bus.publish(halted);
      });

  bus.publish(hedge::CapReachedEvent{HedgeSide::Short, "JASMYUSDT", 1500.0, 1,
                                     0});

  EXPECT_EQ(halts, 1);
}

// -----------------------------------------------------------------------------
// 6. Field values survive publish → dispatch, including nested domain types.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  hedge::OrderFilledEvent received;

  bus.subscribe<hedge::OrderFilledEvent>(
      [&received](const hedge::OrderFilledEvent& e) { received = e; });

  hedge::OrderFilledEvent filled;
  filled.side = HedgeSide::Short;
  filled.request.idempotency_key = "JASMYUSDT-L0-E42";
  filled.request.symbol = "JASMYUSDT";
  filled.request.notional_usd = 1500.0;
  filled.result.idempotency_key = "JASMYUSDT-L0-E42";
  filled.result.filled_notional_usd = 1500.0;
  filled.result.avg_price = 0.0125;
  filled.timestamp_ms = 42;
  bus.publish(filled);

  EXPECT_EQ(received.side, HedgeSide::Short);
  EXPECT_EQ(received.request.idempotency_key, "JASMYUSDT-L0-E42");
  EXPECT_DOUBLE_EQ(received.result.filled_notional_usd, 1500.0);
  EXPECT_DOUBLE_EQ(received.result.avg_price, 0.0125);
  EXPECT_EQ(received.timestamp_ms, 42);
}

// -----------------------------------------------------------------------------
// 7. A subscriber that throws does not stop delivery to the others, and
//    publish() returns normally.
// Why: The state machine publishes mid-transition; an exception escaping a
//      log sink would abandon the transition half done.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int before = 0;
  int after = 0;

  bus.subscribe([&before](const hedge::Event&) { ++before; });
  bus.subscribe([](const hedge::Event&) {
    throw std::runtime_error("log sink closed");
  });
  bus.subscribe([&after](const hedge::Event&) { ++after; });
  EXPECT_EQ(bus.subscriberCount(), 3u);

  EXPECT_NO_THROW(bus.publish(makePrice("HYPEUSDT", 90.0)));
  EXPECT_NO_THROW(
      bus.publish(makeTransition(PositionState::Flat, PositionState::Entering)));

  EXPECT_EQ(before, 2);
  EXPECT_EQ(after, 2);
  EXPECT_EQ(bus.failedDeliveries(), 2u);
}
