#pragma once
#include <variant>

#include "claw/trigger.hpp"
#include "claw/types.hpp"

namespace claw {

struct PostOrder {
  Ts        ts{};
  AccountId maker{};
  bool      sells_asset_zero{true};
  Amount    amount_in{};
  Amount    min_amount_out{};
  Ts        duration{};
  bool      via_agent{false};
};

struct CancelOrder {
  Ts        ts{};
  AccountId maker{};
  OrderId   id{};
};

struct Swap {
  Ts           ts{};
  AccountId    taker{};
  bool         wants_asset_zero{false};
  SignedAmount amount_specified{};
};

struct ArmTrigger {
  Ts        ts{};
  OrderId   id{};
  AccountId maker{};
  Price     limit_price{};
  Direction direction{Direction::Lower};
};

struct PriceTick {
  Ts     ts{};
  Amount reserve0{};
  Amount reserve1{};
};

using Event = std::variant<PostOrder, CancelOrder, Swap, ArmTrigger, PriceTick>;

} // namespace claw
