#include "claw/escrow_ledger.hpp"

#include <limits>

namespace claw {

EscrowLedger::EscrowLedger(Custody& custody, AccountId self, RulesConfig cfg)
  : custody_(custody), self_(self), cfg_(cfg) {}

Order* EscrowLedger::find_(OrderId id) noexcept {
  if (id == 0 || id > orders_.size()) return nullptr;
  return &orders_[id - 1];
}

const Order* EscrowLedger::order(OrderId id) const noexcept {
  if (id == 0 || id > orders_.size()) return nullptr;
  return &orders_[id - 1];
}

Amount EscrowLedger::locked(AssetId asset) const noexcept {
  auto it = locked_.find(asset);
  return (it == locked_.end()) ? Amount{0} : it->second;
}

PostAck EscrowLedger::post(const PostRequest& req) {
  PostAck ack{};

  if (req.amount_in == 0) {
    ack.reject_reason = RejectReason::InvalidAmount;
    return ack;
  }
  if (!is_valid_venue(req.venue)) {
    ack.reject_reason = RejectReason::InvalidVenue;
    return ack;
  }
  if (req.duration < cfg_.min_duration ||
      req.now > std::numeric_limits<Ts>::max() - req.duration) {
    ack.reject_reason = RejectReason::InvalidDuration;
    return ack;
  }

  const AssetId sell = sell_asset(req.venue, req.sells_asset_zero);
  if (locked(sell) > std::numeric_limits<Amount>::max() - req.amount_in) {
    ack.reject_reason = RejectReason::InvalidAmount;
    return ack;
  }

  // Pull funds first: nothing is recorded unless custody accepted the lock.
  if (!custody_.transfer(sell, req.caller, self_, req.amount_in)) {
    ack.reject_reason = RejectReason::TransferFailed;
    return ack;
  }

  Order o{};
  o.id = next_order_id();
  o.maker = req.caller;
  o.venue = fingerprint(req.venue);
  o.sell_asset = sell;
  o.buy_asset = buy_asset(req.venue, req.sells_asset_zero);
  o.sells_asset_zero = req.sells_asset_zero;
  o.amount_in = req.amount_in;
  o.min_amount_out = req.min_amount_out;
  o.created = req.now;
  o.expiry = req.now + req.duration;
  o.origin = req.origin_is_direct_caller ? OrderOrigin::Direct : OrderOrigin::Agent;

  locked_[sell] += o.amount_in;
  index_.append(o.venue, o.id);
  orders_.push_back(o);

  ack.id = o.id;
  ack.status = OrderStatus::Accepted;
  return ack;
}

void EscrowLedger::deactivate_(Order& o, OrderState to) noexcept {
  o.active = false;
  o.state = to;
  locked_[o.sell_asset] -= o.amount_in;
}

void EscrowLedger::reactivate_(Order& o) noexcept {
  o.active = true;
  o.state = OrderState::Open;
  locked_[o.sell_asset] += o.amount_in;
}

void EscrowLedger::unindex_(const Order& o) noexcept {
  (void)index_.remove(o.venue, o.id);
}

bool EscrowLedger::refund_(Order& o) {
  return custody_.transfer(o.sell_asset, self_, o.maker, o.amount_in);
}

CancelAck EscrowLedger::cancel(OrderId id, const VenueKey& venue, AccountId caller) {
  CancelAck ack{};
  ack.id = id;

  Order* o = find_(id);
  if (!o) {
    ack.reject_reason = RejectReason::NotFound;
    return ack;
  }
  if (o->maker != caller) {
    ack.reject_reason = RejectReason::Unauthorized;
    return ack;
  }
  if (!o->active) {
    ack.reject_reason = RejectReason::NotActive;
    return ack;
  }
  if (fingerprint(venue) != o->venue) {
    ack.reject_reason = RejectReason::VenueMismatch;
    return ack;
  }

  deactivate_(*o, OrderState::Cancelled);
  if (!refund_(*o)) {
    reactivate_(*o);
    ack.reject_reason = RejectReason::TransferFailed;
    return ack;
  }
  unindex_(*o);

  ack.refunded = o->amount_in;
  ack.status = OrderStatus::Accepted;
  return ack;
}

RejectReason EscrowLedger::expire(OrderId id, Ts now) {
  Order* o = find_(id);
  if (!o) return RejectReason::NotFound;
  if (!o->active) return RejectReason::NotActive;
  if (!is_expired(*o, now)) return RejectReason::None;

  deactivate_(*o, OrderState::Expired);
  if (!refund_(*o)) {
    reactivate_(*o);
    return RejectReason::TransferFailed;
  }
  unindex_(*o);
  return RejectReason::None;
}

SettleResult EscrowLedger::settle(OrderId id, AccountId payer, AccountId recipient,
                                  FillKind kind, Ts now) {
  SettleResult out{};

  Order* o = find_(id);
  if (!o) {
    out.reject_reason = RejectReason::NotFound;
    return out;
  }
  if (!o->active) {
    out.reject_reason = RejectReason::NotActive;
    return out;
  }

  // First mutation: a redelivered or re-entrant fill now sees NotActive.
  deactivate_(*o, OrderState::Filled);

  // credit-from-counterparty
  if (!custody_.transfer(o->buy_asset, payer, o->maker, o->min_amount_out)) {
    reactivate_(*o);
    out.reject_reason = RejectReason::TransferFailed;
    return out;
  }

  // debit-to-counterparty
  if (!custody_.transfer(o->sell_asset, self_, recipient, o->amount_in)) {
    // escrow must hold amount_in; undo the first leg if custody disagrees
    if (custody_.transfer(o->buy_asset, o->maker, payer, o->min_amount_out)) {
      reactivate_(*o);
      out.reject_reason = RejectReason::TransferFailed;
      return out;
    }
    // Maker keeps the payment and amount_in stays in escrow unclaimed. The
    // order is settled from the maker's side and leaves the book.
    unindex_(*o);
    out.reject_reason = RejectReason::CompensationFailed;
    return out;
  }
  unindex_(*o);

  Fill& f = out.fill;
  f.id = next_fill_id_++;
  f.ts = now;
  f.kind = kind;
  f.order_id = o->id;
  f.venue = o->venue;
  f.maker = o->maker;
  f.counterparty = recipient;
  f.maker_asset = o->buy_asset;
  f.maker_received = o->min_amount_out;
  f.counterparty_asset = o->sell_asset;
  f.counterparty_received = o->amount_in;

  out.status = OrderStatus::Accepted;
  return out;
}

std::vector<Order> EscrowLedger::live_orders(VenueId venue) const {
  std::vector<Order> out;
  const auto& ids = index_.ids(venue);
  out.reserve(ids.size());
  for (OrderId id : ids) {
    if (const Order* o = order(id)) out.push_back(*o);
  }
  return out;
}

std::vector<Order> EscrowLedger::orders_by_maker(AccountId maker) const {
  std::vector<Order> out;
  for (const auto& o : orders_) {
    if (o.maker == maker) out.push_back(o);
  }
  return out;
}

} // namespace claw
