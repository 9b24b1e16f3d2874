#pragma once
#include "claw/types.hpp"

namespace claw {

// Settlement record of one order. maker_received is paid in the order's buy
// asset, counterparty_received in its sell asset.
struct Fill {
  FillId    id{};
  Ts        ts{};
  FillKind  kind{FillKind::Market};

  OrderId   order_id{};
  VenueId   venue{};
  AccountId maker{};
  AccountId counterparty{};

  AssetId   maker_asset{};
  Amount    maker_received{};
  AssetId   counterparty_asset{};
  Amount    counterparty_received{};
};

} // namespace claw
