#pragma once
#include <initializer_list>
#include <memory>

#include "claw/custody.hpp"
#include "claw/escrow_ledger.hpp"
#include "claw/guard.hpp"
#include "claw/matching_engine.hpp"

namespace clawtest {

constexpr claw::AccountId kEngine = 0xE0;
constexpr claw::AccountId kCoordinator = 0xC0;
constexpr claw::AccountId kRelay = 0xA0;
constexpr claw::AccountId kAdmin = 0xAD;
constexpr claw::AccountId kBeneficiary = 0xBE;
constexpr claw::AccountId kMaker = 1001;
constexpr claw::AccountId kMaker2 = 1002;
constexpr claw::AccountId kTaker = 2001;

constexpr claw::AssetId kA = 1;  // asset0
constexpr claw::AssetId kB = 2;  // asset1

constexpr claw::Amount kFunding = 1'000'000;
constexpr claw::Ts kNow = 100;

// One engine on one A/B venue, every party funded in both assets.
struct Desk {
  explicit Desk(claw::RulesConfig rules = {})
    : eng(tokens, kEngine, kCoordinator, std::make_shared<claw::SingleAdmin>(kAdmin), rules),
      venue(eng.venue(kA, kB, 3000, 60)) {
    for (claw::AccountId who : {kMaker, kMaker2, kTaker, kBeneficiary}) {
      tokens.mint(kA, who, kFunding);
      tokens.mint(kB, who, kFunding);
    }
    (void)eng.set_relay(kAdmin, kRelay);
  }

  claw::PostAck post(claw::AccountId maker, bool sells0, claw::Amount in, claw::Amount min_out,
                     claw::Ts duration = 3600, claw::Ts now = kNow, bool direct = true) {
    claw::PostRequest req{};
    req.venue = venue;
    req.sells_asset_zero = sells0;
    req.amount_in = in;
    req.min_amount_out = min_out;
    req.duration = duration;
    req.now = now;
    req.caller = maker;
    req.origin_is_direct_caller = direct;
    return eng.post_order(req);
  }

  claw::MatchOutcome swap(bool wants0, claw::SignedAmount amount, claw::Ts now = kNow,
                          claw::AccountId taker = kTaker) {
    claw::SwapRequest req{};
    req.venue = venue;
    req.taker = taker;
    req.taker_wants_asset_zero = wants0;
    req.amount_specified = amount;
    req.now = now;
    return eng.match_incoming_swap(kCoordinator, req);
  }

  claw::VenueId venue_id() const { return claw::fingerprint(venue); }

  claw::TokenLedger tokens;
  claw::MatchingEngine eng;
  claw::VenueKey venue;
};

} // namespace clawtest
