#pragma once

#include "hedge/domain/collaborator_error.hpp"

#include <string>

namespace hedge {

// -----------------------------------------------------------------------------
// IPriceSource — abstract mark price provider
// -----------------------------------------------------------------------------
//
// @brief  Supplies the current mark price for a symbol on demand.
//
// @details
// The control loop calls get_mark_price() once per side per tick (once per
// symbol per tick in ratio mode). Implementations:
//   - ZmqPriceFeed         → latest tick received on a ZeroMQ SUB socket
//   - ScriptedPriceSource  → test double replaying a fixed price sequence
//
// Failure contract:
//   Returns ErrorCode::Unavailable when no usable price exists (network
//   error, nothing received yet, last price stale) and ErrorCode::Timeout
//   when the call exceeded the timeout the implementation was built with.
//   It never blocks indefinitely and never throws for a missing price.
//
// Ownership:
//   main() (or the test) owns the implementation; ControlLoop and
//   PaperExchangeClient hold references.
// -----------------------------------------------------------------------------
class IPriceSource {
 public:
  virtual ~IPriceSource() = default;

  // Returns a strictly positive price, or a CollaboratorError.
  virtual domain::Result<double> get_mark_price(const std::string& symbol) = 0;
};

}  // namespace hedge
