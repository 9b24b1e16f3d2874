#pragma once
#include <cstddef>
#include <functional>
#include <utility>
#include <unordered_map>

#include "claw/types.hpp"

namespace claw {

// Token movement collaborator. transfer() is all-or-nothing and returns false
// when it cannot move the full amount.
class Custody {
public:
  virtual ~Custody() = default;

  virtual Amount balance_of(AssetId asset, AccountId account) const noexcept = 0;
  virtual bool transfer(AssetId asset, AccountId from, AccountId to, Amount amount) = 0;
};

// In-memory balances keyed by (asset, account).
class TokenLedger : public Custody {
public:
  // Called after every successful transfer. Lets callers model tokens that
  // hand control back to the recipient.
  using TransferHook = std::function<void(AssetId, AccountId from, AccountId to, Amount)>;

  Amount balance_of(AssetId asset, AccountId account) const noexcept override;
  bool transfer(AssetId asset, AccountId from, AccountId to, Amount amount) override;

  bool mint(AssetId asset, AccountId to, Amount amount);
  Amount total_supply(AssetId asset) const noexcept;

  void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

private:
  struct Key {
    AssetId asset{};
    AccountId account{};
    bool operator==(const Key&) const = default;
  };

  struct KeyHash {
    std::size_t operator()(const Key& k) const noexcept {
      return std::hash<uint64_t>{}(k.account * 0x9E3779B97F4A7C15ull ^ k.asset);
    }
  };

  std::unordered_map<Key, Amount, KeyHash> balances_;
  std::unordered_map<AssetId, Amount> supply_;
  TransferHook hook_{};
};

} // namespace claw
