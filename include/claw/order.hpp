#pragma once
#include "claw/types.hpp"

namespace claw {

// Resting commitment: sell a fixed amount_in of one venue asset for at least
// min_amount_out of the other. Records are never deleted, only deactivated.
struct Order {
  OrderId     id{};
  AccountId   maker{};
  VenueId     venue{};
  AssetId     sell_asset{};
  AssetId     buy_asset{};
  bool        sells_asset_zero{true};

  Amount      amount_in{};
  Amount      min_amount_out{};

  Ts          created{};
  Ts          expiry{};

  bool        active{true};
  OrderState  state{OrderState::Open};
  OrderOrigin origin{OrderOrigin::Direct};
};

inline constexpr bool is_expired(const Order& o, Ts now) noexcept {
  return now > o.expiry;
}

} // namespace claw
