#pragma once

#include <string>
#include <variant>

namespace hedge {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode — failure classes reported by external collaborators
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every way a PriceSource or ExchangeClient call can fail.
//
// @details
// The codes split into two families that the ControlLoop treats differently:
//
//   Transient (retried with exponential backoff, never escalated):
//     Unavailable  — network error, connection refused, no data yet
//     Timeout      — the call exceeded its configured timeout
//     RateLimited  — the venue asked us to slow down
//
//   Terminal (surfaced, halts the affected side only):
//     Rejected            — order refused by the venue (bad params, etc.)
//     InvalidCredentials  — API key / signature refused
//     InsufficientMargin  — order refused for lack of margin
//
// Thread model:
//   Plain enum, value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  Unavailable,
  Timeout,
  RateLimited,
  Rejected,
  InvalidCredentials,
  InsufficientMargin,
};

// -----------------------------------------------------------------------------
// CollaboratorError — the error half of a collaborator Result
// -----------------------------------------------------------------------------
struct CollaboratorError {
  ErrorCode code{ErrorCode::Unavailable};
  std::string message;  // Human-readable detail from the collaborator
};

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
// Every collaborator call returns either its value or a CollaboratorError.
// Callers inspect it with std::get_if, the same way EventBus subscribers
// inspect the Event variant.
// -----------------------------------------------------------------------------
template <typename T>
using Result = std::variant<T, CollaboratorError>;

// -------------------------------------------------------------------------
// isTransient(code)
// -------------------------------------------------------------------------
// @brief  Returns true if a failure with this code should be retried.
// -------------------------------------------------------------------------
inline bool isTransient(ErrorCode code) {
  switch (code) {
    case ErrorCode::Unavailable:
    case ErrorCode::Timeout:
    case ErrorCode::RateLimited:
      return true;
    case ErrorCode::Rejected:
    case ErrorCode::InvalidCredentials:
    case ErrorCode::InsufficientMargin:
      return false;
  }
  return false;
}

inline const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Unavailable:        return "Unavailable";
    case ErrorCode::Timeout:            return "Timeout";
    case ErrorCode::RateLimited:        return "RateLimited";
    case ErrorCode::Rejected:           return "Rejected";
    case ErrorCode::InvalidCredentials: return "InvalidCredentials";
    case ErrorCode::InsufficientMargin: return "InsufficientMargin";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace hedge
