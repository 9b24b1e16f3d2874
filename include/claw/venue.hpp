#pragma once
#include "claw/types.hpp"

namespace claw {

// Immutable venue configuration: the asset pair plus fee/tick parameters and
// the engine bound to it. Its fingerprint keys the order index.
struct VenueKey {
  AssetId   asset0{};
  AssetId   asset1{};
  uint32_t  fee{};          // hundredths of a bip
  int32_t   tick_spacing{};
  AccountId hooks{};
};

inline constexpr uint32_t kMaxFee = 1'000'000;

inline constexpr bool is_valid_venue(const VenueKey& k) noexcept {
  return k.asset0 < k.asset1 && k.fee <= kMaxFee && k.tick_spacing > 0;
}

// Deterministic 64-bit FNV-1a over the fields in fixed little-endian order.
VenueId fingerprint(const VenueKey& k) noexcept;

inline AssetId sell_asset(const VenueKey& k, bool sells_asset_zero) noexcept {
  return sells_asset_zero ? k.asset0 : k.asset1;
}

inline AssetId buy_asset(const VenueKey& k, bool sells_asset_zero) noexcept {
  return sells_asset_zero ? k.asset1 : k.asset0;
}

} // namespace claw
