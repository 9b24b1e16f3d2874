#include "claw/matching_engine.hpp"

#include <limits>
#include <utility>

namespace claw {

MatchingEngine::MatchingEngine(Custody& custody,
                               AccountId self,
                               AccountId swap_coordinator,
                               std::shared_ptr<const AccessPolicy> admin,
                               RulesConfig rules)
  : ledger_(custody, self, rules),
    swap_coordinator_(swap_coordinator),
    admin_(std::move(admin)) {}

VenueKey MatchingEngine::venue(AssetId a, AssetId b, uint32_t fee, int32_t tick_spacing) const noexcept {
  VenueKey k{};
  k.asset0 = (a < b) ? a : b;
  k.asset1 = (a < b) ? b : a;
  k.fee = fee;
  k.tick_spacing = tick_spacing;
  k.hooks = ledger_.self();
  return k;
}

RejectReason MatchingEngine::set_relay(AccountId caller, AccountId relay) {
  if (!admin_ || !admin_->may_configure(caller)) return RejectReason::Unauthorized;
  if (relay == kNoAccount) return RejectReason::RelayNotConfigured;
  relay_ = relay;
  return RejectReason::None;
}

PostAck MatchingEngine::post_order(const PostRequest& req) {
  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) {
    PostAck ack{};
    ack.reject_reason = RejectReason::Reentrant;
    return ack;
  }
  return ledger_.post(req);
}

CancelAck MatchingEngine::cancel_order(OrderId id, const VenueKey& venue, AccountId caller) {
  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) {
    CancelAck ack{};
    ack.id = id;
    ack.reject_reason = RejectReason::Reentrant;
    return ack;
  }
  return ledger_.cancel(id, venue, caller);
}

MatchOutcome MatchingEngine::match_incoming_swap(AccountId caller, const SwapRequest& req) {
  MatchOutcome out{};

  auto reject = [&out](RejectReason r) -> MatchOutcome& {
    out.status = OrderStatus::Rejected;
    out.reject_reason = r;
    return out;
  };

  if (caller != swap_coordinator_) return reject(RejectReason::Unauthorized);

  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) return reject(RejectReason::Reentrant);

  // -min has no positive counterpart
  if (req.amount_specified == std::numeric_limits<SignedAmount>::min()) {
    return reject(RejectReason::AmountOverflow);
  }

  // exact-output (and zero) swaps pass straight through
  if (req.amount_specified >= 0) return out;

  const Amount offered = static_cast<Amount>(-req.amount_specified);
  const VenueId venue = fingerprint(req.venue);
  const std::size_t cap = ledger_.config().scan_cap;

  std::size_t i = 0;
  while (out.scanned < cap) {
    // re-read every pass: removals reshuffle (or drop) the venue's vector
    const auto& ids = ledger_.index().ids(venue);
    if (i >= ids.size()) break;

    const OrderId id = ids[i];
    ++out.scanned;

    const Order* o = ledger_.order(id);
    if (!o || !o->active) { ++i; continue; }

    if (o->venue != venue) return reject(RejectReason::PoolMismatch);

    if (is_expired(*o, req.now)) {
      if (ledger_.config().evict_expired && ledger_.expire(id, req.now) == RejectReason::None) {
        // the last id now sits at position i
        out.evicted.push_back(id);
      } else {
        ++i;
      }
      continue;
    }

    const bool compatible = (o->sells_asset_zero == req.taker_wants_asset_zero) &&
                            (offered >= o->min_amount_out);
    if (!compatible) { ++i; continue; }

    const Amount price_paid = o->min_amount_out;
    auto settled = ledger_.settle(id, req.taker, req.taker, FillKind::Market, req.now);
    if (settled.status != OrderStatus::Accepted) return reject(settled.reject_reason);

    out.fill = settled.fill;
    out.input_consumed = offered;
    out.output_delivered = settled.fill.counterparty_received;
    out.surplus = offered - price_paid;
    return out;
  }

  return out;
}

FillAck MatchingEngine::trigger_order(AccountId caller, OrderId id, AccountId beneficiary, Ts now) {
  FillAck ack{};
  ack.id = id;

  if (!relay_) {
    ack.reject_reason = RejectReason::RelayNotConfigured;
    return ack;
  }
  if (caller != *relay_) {
    ack.reject_reason = RejectReason::Unauthorized;
    return ack;
  }

  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) {
    ack.reject_reason = RejectReason::Reentrant;
    return ack;
  }

  const Order* o = ledger_.order(id);
  if (!o) {
    ack.reject_reason = RejectReason::NotFound;
    return ack;
  }
  if (!o->active) {
    ack.reject_reason = RejectReason::NotActive;
    return ack;
  }
  if (is_expired(*o, now)) {
    ack.reject_reason = RejectReason::OrderExpired;
    return ack;
  }

  auto settled = ledger_.settle(id, beneficiary, beneficiary, FillKind::Trigger, now);
  if (settled.status != OrderStatus::Accepted) {
    ack.reject_reason = settled.reject_reason;
    return ack;
  }

  ack.status = OrderStatus::Accepted;
  ack.fill = settled.fill;
  return ack;
}

} // namespace claw
