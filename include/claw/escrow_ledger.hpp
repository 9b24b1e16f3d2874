#pragma once
#include <optional>
#include <unordered_map>
#include <vector>

#include "claw/custody.hpp"
#include "claw/fill.hpp"
#include "claw/order.hpp"
#include "claw/order_index.hpp"
#include "claw/rules.hpp"
#include "claw/types.hpp"
#include "claw/venue.hpp"

namespace claw {

struct PostRequest {
  VenueKey  venue{};
  bool      sells_asset_zero{true};
  Amount    amount_in{};
  Amount    min_amount_out{};
  Ts        duration{};
  Ts        now{};
  AccountId caller{};
  bool      origin_is_direct_caller{true};
};

struct PostAck {
  OrderId id{};
  OrderStatus status{OrderStatus::Rejected};
  RejectReason reject_reason{RejectReason::None};
};

struct CancelAck {
  OrderId id{};
  Amount refunded{};
  OrderStatus status{OrderStatus::Rejected};
  RejectReason reject_reason{RejectReason::None};
};

struct SettleResult {
  OrderStatus status{OrderStatus::Rejected};
  RejectReason reject_reason{RejectReason::None};
  Fill fill{};
};

// Owns order records and the funds locked on behalf of makers. Records live in
// an arena addressed by id - 1 and are never erased.
//
// Not reentrancy-safe on its own: MatchingEngine serializes every mutating
// call behind its guard.
class EscrowLedger {
public:
  EscrowLedger(Custody& custody, AccountId self, RulesConfig cfg = {});

  PostAck post(const PostRequest& req);
  CancelAck cancel(OrderId id, const VenueKey& venue, AccountId caller);

  // Two-leg settlement of an active order: payer sends min_amount_out of the
  // buy asset to the maker, the escrowed amount_in goes to recipient. The
  // order is deactivated before either transfer; a failed leg restores it in
  // place. CompensationFailed if the second leg and its undo both fail.
  SettleResult settle(OrderId id, AccountId payer, AccountId recipient, FillKind kind, Ts now);

  // Evicts an expired active order and refunds its maker.
  RejectReason expire(OrderId id, Ts now);

  // ---- read surface ----
  const Order* order(OrderId id) const noexcept;
  const std::vector<Order>& orders() const noexcept { return orders_; }
  std::vector<Order> live_orders(VenueId venue) const;
  std::vector<Order> orders_by_maker(AccountId maker) const;
  const VenueOrderIndex& index() const noexcept { return index_; }

  Amount locked(AssetId asset) const noexcept;
  const std::unordered_map<AssetId, Amount>& locked_by_asset() const noexcept { return locked_; }

  AccountId self() const noexcept { return self_; }
  const RulesConfig& config() const noexcept { return cfg_; }
  OrderId next_order_id() const noexcept { return static_cast<OrderId>(orders_.size()) + 1; }

private:
  Custody& custody_;
  AccountId self_{};
  RulesConfig cfg_{};

  std::vector<Order> orders_;
  VenueOrderIndex index_;
  std::unordered_map<AssetId, Amount> locked_;
  FillId next_fill_id_{1};

  Order* find_(OrderId id) noexcept;

  // Active flag and escrow bookkeeping only. The index entry is dropped by
  // unindex_ once every transfer of the call succeeded, so a rolled back call
  // leaves the venue's index order untouched.
  void deactivate_(Order& o, OrderState to) noexcept;
  void reactivate_(Order& o) noexcept;
  void unindex_(const Order& o) noexcept;

  bool refund_(Order& o);
};

} // namespace claw
