#pragma once

#include "hedge/exchange/i_exchange_client.hpp"
#include "hedge/exchange/i_price_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace hedge {

// -----------------------------------------------------------------------------
// PaperExchangeClient — deterministic in-process exchange
// -----------------------------------------------------------------------------
//
// @brief  Fills every market order immediately and fully at the current mark
//         price, remembers every outcome by idempotency key, and keeps a
//         per-symbol book for get_position().
//
// @details
// Fill model:
//   - Immediate full fill at IPriceSource::get_mark_price(symbol), zero
//     slippage.
//   - Open/ScaleIn: adds notional_usd / price units in the order direction.
//     The book's average price is the quantity-weighted entry price.
//   - Close: reduce-only. Closes the fraction min(1, notional / entry
//     notional) of the open quantity and reports the entry notional
//     released, so the caller's notional bookkeeping stays in entry terms
//     however far the price has moved.
//
// Idempotency:
//   A key that was executed returns the stored OrderResult. A key that was
//   rejected returns the stored rejection. Neither executes again.
//
// Fault injection (tests and dry runs):
//   failNextOrders(n, code)  next n place_order calls fail with `code`
//                            without reaching the book
//   rejectNext(reason)       next new key is rejected
//   rejectAll(reason)        every new key is rejected until cleared
//   loseNextResponse()       next new key executes but the caller sees
//                            Unavailable, as if the reply was lost in transit
//   setLatencyMs(ms)         simulated round-trip time of every call
//
// Timeouts:
//   Every call carries call_timeout_ms. When the simulated latency exceeds
//   it the caller gets Timeout. For place_order the venue has still acted on
//   the order (executed or rejected it); only the reply is missing, and the
//   outcome can be read back with get_order_status once latency recovers.
//
// Thread model:
//   Not thread-safe. Called only from the control loop thread (and from the
//   test body between ticks).
//
// Ownership:
//   Holds a reference to the IPriceSource; does not own it.
// -----------------------------------------------------------------------------
class PaperExchangeClient final : public IExchangeClient {
 public:
  explicit PaperExchangeClient(IPriceSource& prices,
                               std::int64_t call_timeout_ms = 10000);

  domain::Result<domain::OrderResult> place_order(
      const domain::OrderRequest& request) override;

  domain::Result<domain::ExchangePosition> get_position(
      const std::string& symbol) override;

  domain::Result<std::optional<domain::OrderResult>> get_order_status(
      const std::string& idempotency_key) override;

  // --- Fault injection ------------------------------------------------------
  void failNextOrders(int count, domain::ErrorCode code);
  void rejectNext(std::string reason,
                  domain::ErrorCode code = domain::ErrorCode::Rejected);
  void rejectAll(std::string reason,
                 domain::ErrorCode code = domain::ErrorCode::Rejected);
  void clearRejections();
  void loseNextResponse();
  void setLatencyMs(std::int64_t latency_ms) { latency_ms_ = latency_ms; }

  // -------------------------------------------------------------------------
  // setPosition(symbol, signed_notional_usd, avg_price)
  // -------------------------------------------------------------------------
  // @brief  Installs a position directly, as if it had been opened by an
  //         earlier session. Used to exercise restart reconciliation.
  // -------------------------------------------------------------------------
  void setPosition(const std::string& symbol, double signed_notional_usd,
                   double avg_price);

  // Number of orders that actually reached the book (duplicates excluded).
  int executedCount() const { return executed_count_; }

  // Number of place_order calls received, duplicates and failures included.
  int placeCalls() const { return place_calls_; }

 private:
  struct Book {
    double quantity{0.0};   // Signed units: + long, - short
    double avg_price{0.0};  // Weighted entry price
  };

  domain::Result<domain::OrderResult> submit(
      const domain::OrderRequest& request);
  domain::Result<domain::OrderResult> execute(
      const domain::OrderRequest& request);
  std::optional<domain::CollaboratorError> timeoutError(
      const std::string& what) const;

  IPriceSource& prices_;
  std::int64_t call_timeout_ms_;
  std::int64_t latency_ms_{0};

  std::unordered_map<std::string, Book> books_;
  std::unordered_map<std::string, domain::OrderResult> results_;
  std::unordered_map<std::string, domain::CollaboratorError> rejections_;

  int fail_remaining_{0};
  domain::ErrorCode fail_code_{domain::ErrorCode::Unavailable};

  std::optional<domain::CollaboratorError> reject_next_;
  std::optional<domain::CollaboratorError> reject_all_;
  bool lose_next_response_{false};

  int executed_count_{0};
  int place_calls_{0};
};

}  // namespace hedge
