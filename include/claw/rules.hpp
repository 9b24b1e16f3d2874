#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "claw/types.hpp"

namespace claw {

enum class OrderStatus : uint8_t { Accepted = 0, Rejected = 1 };

enum class RejectReason : uint8_t {
  None = 0,

  // validation
  InvalidAmount,
  InvalidVenue,
  InvalidDuration,
  NotFound,
  NotActive,
  OrderExpired,
  VenueMismatch,
  PoolMismatch,

  // boundary
  AmountOverflow,

  // authorization
  Unauthorized,
  RelayNotConfigured,
  Reentrant,

  // custody
  TransferFailed,
  CompensationFailed   // second settlement leg and its undo both failed
};

std::string_view to_string(RejectReason r) noexcept;

struct RulesConfig {
  // Resting orders examined per incoming swap.
  std::size_t scan_cap{50};

  // Expired orders touched by a scan are evicted and refunded instead of
  // being skipped forever.
  bool evict_expired{true};

  // Shortest accepted order lifetime (seconds).
  Ts min_duration{1};
};

} // namespace claw
