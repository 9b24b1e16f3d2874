#pragma once
#include <cstdint>
#include <string_view>

namespace claw {

using AccountId    = uint64_t;  // maker / taker / relay / contract identity
using AssetId      = uint32_t;
using Amount       = uint64_t;  // fixed-point, token base units
using SignedAmount = int64_t;   // < 0 exact-input, > 0 exact-output
using Price        = int64_t;   // fixed-point, see kPriceScale
using OrderId      = uint64_t;
using TriggerId    = uint64_t;
using FillId       = uint64_t;
using VenueId      = uint64_t;  // venue fingerprint
using Ts           = int64_t;   // unix seconds

inline constexpr Price kPriceScale = 100'000'000; // 1e8

inline constexpr AccountId kNoAccount = 0;

enum class OrderOrigin : uint8_t { Direct = 0, Agent = 1 };

enum class OrderState : uint8_t { Open = 0, Filled = 1, Cancelled = 2, Expired = 3 };

enum class FillKind : uint8_t { Market = 0, Trigger = 1 };

inline std::string_view to_string(OrderOrigin o) noexcept {
  return (o == OrderOrigin::Direct) ? "direct" : "agent";
}

inline std::string_view to_string(OrderState s) noexcept {
  switch (s) {
    case OrderState::Open:      return "open";
    case OrderState::Filled:    return "filled";
    case OrderState::Cancelled: return "cancelled";
    case OrderState::Expired:   return "expired";
  }
  return "unknown";
}

inline std::string_view to_string(FillKind k) noexcept {
  return (k == FillKind::Market) ? "market" : "trigger";
}

} // namespace claw
