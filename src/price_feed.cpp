#include "claw/price_feed.hpp"

#include <limits>

namespace claw {

std::optional<PriceSample> derive_price(const ReserveSample& s, Price scale) noexcept {
  if (s.reserve0 == 0 || scale <= 0) return std::nullopt;

  __extension__ typedef unsigned __int128 u128;
  const u128 num = static_cast<u128>(s.reserve1) * static_cast<u128>(scale);
  const u128 px = num / static_cast<u128>(s.reserve0);
  if (px > static_cast<u128>(std::numeric_limits<Price>::max())) return std::nullopt;

  return PriceSample{s.ts, static_cast<Price>(px)};
}

} // namespace claw
