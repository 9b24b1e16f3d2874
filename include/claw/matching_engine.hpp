#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "claw/custody.hpp"
#include "claw/escrow_ledger.hpp"
#include "claw/fill.hpp"
#include "claw/guard.hpp"
#include "claw/rules.hpp"
#include "claw/venue.hpp"

namespace claw {

// Swap as seen by the venue's swap coordinator before pricing.
struct SwapRequest {
  VenueKey     venue{};
  AccountId    taker{};
  bool         taker_wants_asset_zero{false};
  SignedAmount amount_specified{};  // < 0 exact-input
  Ts           now{};
};

struct MatchOutcome {
  OrderStatus status{OrderStatus::Accepted};
  RejectReason reject_reason{RejectReason::None};

  std::optional<Fill> fill{};

  // Adjustment handed back to the swap coordinator. With no match all three
  // stay zero and the swap prices normally.
  Amount input_consumed{0};   // whole offered amount
  Amount output_delivered{0}; // maker's full amount_in
  Amount surplus{0};          // input_consumed - min_amount_out, not refunded here

  std::size_t scanned{0};
  std::vector<OrderId> evicted{};

  bool matched() const noexcept { return fill.has_value(); }
};

struct FillAck {
  OrderId id{};
  OrderStatus status{OrderStatus::Rejected};
  RejectReason reject_reason{RejectReason::None};
  std::optional<Fill> fill{};
};

// Entry surface of the venue hook: order posting/cancel for makers, swap-side
// matching for the swap coordinator and the relay-only trigger fill.
class MatchingEngine {
public:
  MatchingEngine(Custody& custody,
                 AccountId self,
                 AccountId swap_coordinator,
                 std::shared_ptr<const AccessPolicy> admin,
                 RulesConfig rules = {});

  MatchingEngine(const MatchingEngine&) = delete;
  MatchingEngine& operator=(const MatchingEngine&) = delete;

  PostAck post_order(const PostRequest& req);
  CancelAck cancel_order(OrderId id, const VenueKey& venue, AccountId caller);

  MatchOutcome match_incoming_swap(AccountId caller, const SwapRequest& req);

  // Privileged fill authorized by the trigger authority. Counterparty funds
  // come from beneficiary instead of a live taker.
  FillAck trigger_order(AccountId caller, OrderId id, AccountId beneficiary, Ts now);

  // Binds the relay identity allowed to call trigger_order.
  RejectReason set_relay(AccountId caller, AccountId relay);

  const EscrowLedger& ledger() const noexcept { return ledger_; }
  const RulesConfig& rules() const noexcept { return ledger_.config(); }

  AccountId self() const noexcept { return ledger_.self(); }
  AccountId swap_coordinator() const noexcept { return swap_coordinator_; }
  std::optional<AccountId> relay() const noexcept { return relay_; }

  // Venue descriptor for a pair routed through this engine.
  VenueKey venue(AssetId a, AssetId b, uint32_t fee, int32_t tick_spacing) const noexcept;

private:
  ReentrancyGuard guard_{};
  EscrowLedger ledger_;
  AccountId swap_coordinator_{};
  std::shared_ptr<const AccessPolicy> admin_;
  std::optional<AccountId> relay_{};
};

} // namespace claw
