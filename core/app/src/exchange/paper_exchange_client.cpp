#include "hedge/exchange/paper_exchange_client.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace hedge {

using domain::CollaboratorError;
using domain::ErrorCode;
using domain::OrderPurpose;
using domain::OrderRequest;
using domain::OrderResult;
using domain::Result;
using domain::Side;

PaperExchangeClient::PaperExchangeClient(IPriceSource& prices,
                                         std::int64_t call_timeout_ms)
    : prices_(prices), call_timeout_ms_(call_timeout_ms) {}

std::optional<CollaboratorError> PaperExchangeClient::timeoutError(
    const std::string& what) const {
  if (latency_ms_ <= call_timeout_ms_) {
    return std::nullopt;
  }
  return CollaboratorError{ErrorCode::Timeout,
                           what + ": no reply within " +
                               std::to_string(call_timeout_ms_) + " ms"};
}

// -----------------------------------------------------------------------------
// place_order(): injection → dedupe → rejection → execute → timeout
// -----------------------------------------------------------------------------
Result<OrderResult> PaperExchangeClient::place_order(
    const OrderRequest& request) {
  ++place_calls_;
  Result<OrderResult> result = submit(request);
  if (auto timeout = timeoutError("place_order " + request.idempotency_key)) {
    return *timeout;
  }
  return result;
}

Result<OrderResult> PaperExchangeClient::submit(const OrderRequest& request) {
  if (fail_remaining_ > 0) {
    --fail_remaining_;
    return CollaboratorError{fail_code_, "injected failure"};
  }

  // --- Idempotency: a known key never executes twice ----------------------
  if (auto it = results_.find(request.idempotency_key); it != results_.end()) {
    std::cout << "[PaperExchange] duplicate key " << request.idempotency_key
              << ", returning stored fill\n";
    return it->second;
  }
  if (auto it = rejections_.find(request.idempotency_key);
      it != rejections_.end()) {
    return it->second;
  }

  // --- Injected rejections (recorded against the key) ----------------------
  std::optional<CollaboratorError> rejection;
  if (reject_next_) {
    rejection = std::move(reject_next_);
    reject_next_.reset();
  } else if (reject_all_) {
    rejection = reject_all_;
  }
  if (rejection) {
    rejections_[request.idempotency_key] = *rejection;
    std::cerr << "[PaperExchange] rejected " << request.idempotency_key
              << ": " << rejection->message << "\n";
    return *rejection;
  }

  Result<OrderResult> result = execute(request);

  if (std::holds_alternative<OrderResult>(result) && lose_next_response_) {
    lose_next_response_ = false;
    std::cerr << "[PaperExchange] dropped response for "
              << request.idempotency_key << "\n";
    return CollaboratorError{ErrorCode::Unavailable, "response lost"};
  }
  return result;
}

// -----------------------------------------------------------------------------
// execute(): fill at mark and update the book
// -----------------------------------------------------------------------------
Result<OrderResult> PaperExchangeClient::execute(const OrderRequest& request) {
  if (!(request.notional_usd > 0.0) || !std::isfinite(request.notional_usd)) {
    CollaboratorError err{ErrorCode::Rejected, "notional must be positive"};
    rejections_[request.idempotency_key] = err;
    return err;
  }

  Result<double> mark = prices_.get_mark_price(request.symbol);
  if (const auto* err = std::get_if<CollaboratorError>(&mark)) {
    // Nothing executed, nothing recorded: a retry with the same key is a
    // fresh attempt.
    return *err;
  }
  const double price = std::get<double>(mark);

  Book& book = books_[request.symbol];
  const double direction = (request.side == Side::Buy) ? 1.0 : -1.0;
  double filled_notional = 0.0;

  if (request.purpose == OrderPurpose::Close) {
    // Reduce-only: the order must point against the open quantity.
    const bool reduces = (book.quantity > 0.0 && direction < 0.0) ||
                         (book.quantity < 0.0 && direction > 0.0);
    if (!reduces) {
      CollaboratorError err{ErrorCode::Rejected,
                            "reduce-only close with no matching position"};
      rejections_[request.idempotency_key] = err;
      return err;
    }

    const double entry_notional = std::abs(book.quantity) * book.avg_price;
    const double fraction =
        std::min(1.0, request.notional_usd / entry_notional);
    filled_notional = entry_notional * fraction;

    book.quantity -= book.quantity * fraction;
    if (fraction >= 1.0 || std::abs(book.quantity) * book.avg_price < 1e-9) {
      book = Book{};
    }
  } else {
    const double fill_qty = direction * request.notional_usd / price;

    if (book.quantity == 0.0) {
      book.quantity = fill_qty;
      book.avg_price = price;
    } else if ((book.quantity > 0.0) == (fill_qty > 0.0)) {
      // Same direction: weighted average entry.
      double new_total = book.quantity + fill_qty;
      book.avg_price =
          (book.quantity * book.avg_price + fill_qty * price) / new_total;
      book.quantity = new_total;
    } else {
      CollaboratorError err{ErrorCode::Rejected,
                            "opening order against an opposite position"};
      rejections_[request.idempotency_key] = err;
      return err;
    }
    filled_notional = request.notional_usd;
  }

  OrderResult result;
  result.idempotency_key = request.idempotency_key;
  result.filled_notional_usd = filled_notional;
  result.avg_price = price;
  result.status = domain::OrderStatus::Filled;

  results_[request.idempotency_key] = result;
  ++executed_count_;

  std::cout << "[PaperExchange] filled " << request.idempotency_key << " "
            << domain::toString(request.side) << " $" << filled_notional
            << " @ " << price << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// get_position(): signed entry notional
// -----------------------------------------------------------------------------
Result<domain::ExchangePosition> PaperExchangeClient::get_position(
    const std::string& symbol) {
  if (auto timeout = timeoutError("get_position " + symbol)) {
    return *timeout;
  }
  domain::ExchangePosition pos;
  pos.symbol = symbol;

  if (auto it = books_.find(symbol); it != books_.end()) {
    pos.notional_usd = it->second.quantity * it->second.avg_price;
    pos.avg_price = it->second.avg_price;
  }
  return pos;
}

Result<std::optional<OrderResult>> PaperExchangeClient::get_order_status(
    const std::string& idempotency_key) {
  if (auto timeout = timeoutError("get_order_status " + idempotency_key)) {
    return *timeout;
  }
  if (auto it = results_.find(idempotency_key); it != results_.end()) {
    return std::optional<OrderResult>(it->second);
  }
  if (auto it = rejections_.find(idempotency_key); it != rejections_.end()) {
    return it->second;
  }
  return std::optional<OrderResult>{};
}

// -----------------------------------------------------------------------------
// Fault injection
// -----------------------------------------------------------------------------
void PaperExchangeClient::failNextOrders(int count, ErrorCode code) {
  fail_remaining_ = count;
  fail_code_ = code;
}

void PaperExchangeClient::rejectNext(std::string reason, ErrorCode code) {
  reject_next_ = CollaboratorError{code, std::move(reason)};
}

void PaperExchangeClient::rejectAll(std::string reason, ErrorCode code) {
  reject_all_ = CollaboratorError{code, std::move(reason)};
}

void PaperExchangeClient::clearRejections() {
  reject_next_.reset();
  reject_all_.reset();
}

void PaperExchangeClient::loseNextResponse() { lose_next_response_ = true; }

void PaperExchangeClient::setPosition(const std::string& symbol,
                                      double signed_notional_usd,
                                      double avg_price) {
  Book& book = books_[symbol];
  if (signed_notional_usd == 0.0 || avg_price <= 0.0) {
    book = Book{};
    return;
  }
  book.quantity = signed_notional_usd / avg_price;
  book.avg_price = avg_price;
}

}  // namespace hedge
