#include "claw/rules.hpp"

namespace claw {

std::string_view to_string(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:               return "None";
    case RejectReason::InvalidAmount:      return "InvalidAmount";
    case RejectReason::InvalidVenue:       return "InvalidVenue";
    case RejectReason::InvalidDuration:    return "InvalidDuration";
    case RejectReason::NotFound:           return "NotFound";
    case RejectReason::NotActive:          return "NotActive";
    case RejectReason::OrderExpired:       return "OrderExpired";
    case RejectReason::VenueMismatch:      return "VenueMismatch";
    case RejectReason::PoolMismatch:       return "PoolMismatch";
    case RejectReason::AmountOverflow:     return "AmountOverflow";
    case RejectReason::Unauthorized:       return "Unauthorized";
    case RejectReason::RelayNotConfigured: return "RelayNotConfigured";
    case RejectReason::Reentrant:          return "Reentrant";
    case RejectReason::TransferFailed:     return "TransferFailed";
    case RejectReason::CompensationFailed: return "CompensationFailed";
  }
  return "Unknown";
}

} // namespace claw
