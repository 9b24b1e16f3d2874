#pragma once
#include <optional>

#include "claw/types.hpp"

namespace claw {

// Numeric fields of a pair's reserve-sync notification.
struct ReserveSample {
  Ts ts{};
  Amount reserve0{};
  Amount reserve1{};
};

struct PriceSample {
  Ts ts{};
  Price price{};
};

// price = reserve1 * scale / reserve0; nullopt if reserve0 is zero or the
// result does not fit in Price.
std::optional<PriceSample> derive_price(const ReserveSample& s, Price scale = kPriceScale) noexcept;

} // namespace claw
