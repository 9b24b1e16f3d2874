#include "claw/custody.hpp"

#include <limits>

namespace claw {

Amount TokenLedger::balance_of(AssetId asset, AccountId account) const noexcept {
  auto it = balances_.find(Key{asset, account});
  return (it == balances_.end()) ? Amount{0} : it->second;
}

bool TokenLedger::transfer(AssetId asset, AccountId from, AccountId to, Amount amount) {
  if (amount == 0) return true;

  auto it = balances_.find(Key{asset, from});
  if (it == balances_.end() || it->second < amount) return false;

  Amount& dst = balances_[Key{asset, to}];
  if (from != to && dst > std::numeric_limits<Amount>::max() - amount) return false;

  // operator[] may rehash; look the source up again
  balances_[Key{asset, from}] -= amount;
  dst += amount;

  if (hook_) hook_(asset, from, to, amount);
  return true;
}

bool TokenLedger::mint(AssetId asset, AccountId to, Amount amount) {
  Amount& s = supply_[asset];
  if (s > std::numeric_limits<Amount>::max() - amount) return false;
  s += amount;
  balances_[Key{asset, to}] += amount;
  return true;
}

Amount TokenLedger::total_supply(AssetId asset) const noexcept {
  auto it = supply_.find(asset);
  return (it == supply_.end()) ? Amount{0} : it->second;
}

} // namespace claw
