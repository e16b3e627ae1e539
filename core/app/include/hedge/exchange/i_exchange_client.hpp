#pragma once

#include "hedge/domain/collaborator_error.hpp"
#include "hedge/domain/order.hpp"
#include "hedge/domain/position.hpp"

#include <optional>
#include <string>

namespace hedge {

// -----------------------------------------------------------------------------
// IExchangeClient — abstract order and position gateway
// -----------------------------------------------------------------------------
//
// @brief  The only path from the hedge core to an exchange.
//
// @details
// Three capabilities:
//   place_order       — submit one notional-denominated market order
//   get_position      — authoritative position, used for reconciliation
//   get_order_status  — outcome of a previously submitted key, used to
//                       resolve an order whose response was lost
//
// Idempotency contract:
//   place_order() with an idempotency key the exchange has already executed
//   MUST NOT execute again; it returns the original result (or the original
//   rejection). This is what makes retrying an ambiguous failure safe.
//
// Failure contract:
//   Transient codes (Unavailable, Timeout, RateLimited) are retried by the
//   control loop. Rejected, InsufficientMargin and InvalidCredentials halt
//   the side. Every call is bounded by the timeout the implementation was
//   constructed with.
//
// Implementations: PaperExchangeClient (in-process simulation). A live
// REST connector would implement the same interface.
// -----------------------------------------------------------------------------
class IExchangeClient {
 public:
  virtual ~IExchangeClient() = default;

  virtual domain::Result<domain::OrderResult> place_order(
      const domain::OrderRequest& request) = 0;

  // notional_usd in the result is signed: + long, - short, 0 flat.
  virtual domain::Result<domain::ExchangePosition> get_position(
      const std::string& symbol) = 0;

  // -------------------------------------------------------------------------
  // get_order_status(idempotency_key)
  // -------------------------------------------------------------------------
  // @return The stored OrderResult if the key was executed, std::nullopt if
  //         the exchange has never seen it, or the stored rejection as a
  //         CollaboratorError.
  // -------------------------------------------------------------------------
  virtual domain::Result<std::optional<domain::OrderResult>> get_order_status(
      const std::string& idempotency_key) = 0;
};

}  // namespace hedge
