#pragma once
#include <unordered_map>

#include "claw/custody.hpp"
#include "claw/escrow_ledger.hpp"
#include "claw/types.hpp"

namespace claw {

// Per asset: locked == sum of amount_in over active orders selling it.
inline bool escrow_balanced(const EscrowLedger& l) {
  std::unordered_map<AssetId, Amount> expect;
  for (const auto& o : l.orders()) {
    if (o.active) expect[o.sell_asset] += o.amount_in;
  }
  for (const auto& [asset, amt] : l.locked_by_asset()) {
    auto it = expect.find(asset);
    const Amount want = (it == expect.end()) ? Amount{0} : it->second;
    if (amt != want) return false;
  }
  for (const auto& [asset, amt] : expect) {
    if (l.locked(asset) != amt) return false;
  }
  return true;
}

// An order is indexed under its venue iff it is active.
inline bool index_consistent(const EscrowLedger& l) {
  for (const auto& o : l.orders()) {
    if (l.index().contains(o.venue, o.id) != o.active) return false;
  }
  return true;
}

// Custody actually holds what the ledger claims to have locked.
inline bool custody_covers_escrow(const EscrowLedger& l, const Custody& c) {
  for (const auto& [asset, amt] : l.locked_by_asset()) {
    if (c.balance_of(asset, l.self()) < amt) return false;
  }
  return true;
}

} // namespace claw
