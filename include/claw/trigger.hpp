#pragma once
#include <string_view>

#include "claw/types.hpp"

namespace claw {

enum class Direction : uint8_t {
  Lower = 0,  // fire when price < limit
  Upper = 1   // fire when price > limit
};

inline std::string_view to_string(Direction d) noexcept {
  return (d == Direction::Lower) ? "lower" : "upper";
}

// One-shot watch condition bound to a single order. Never re-armed.
struct Trigger {
  TriggerId id{};
  OrderId   order_id{};
  AccountId maker{};
  Price     limit_price{};
  Direction direction{Direction::Lower};

  bool      active{true};
  Ts        armed_at{};
  Ts        fired_at{};
  Price     fired_price{};
};

inline constexpr bool condition_met(const Trigger& t, Price price) noexcept {
  return (t.direction == Direction::Lower) ? (price < t.limit_price)
                                           : (price > t.limit_price);
}

} // namespace claw
