#include <gtest/gtest.h>

#include "claw/invariants.hpp"
#include "engine_fixture.hpp"

using namespace clawtest;

TEST(EscrowLedger, PostLocksFundsAndIndexesOrder) {
  Desk d;

  auto ack = d.post(kMaker, /*sells0*/ true, 100, 190);
  ASSERT_EQ(ack.status, claw::OrderStatus::Accepted);
  EXPECT_EQ(ack.id, 1u);

  const auto* o = d.eng.ledger().order(ack.id);
  ASSERT_NE(o, nullptr);
  EXPECT_TRUE(o->active);
  EXPECT_EQ(o->maker, kMaker);
  EXPECT_EQ(o->sell_asset, kA);
  EXPECT_EQ(o->buy_asset, kB);
  EXPECT_EQ(o->amount_in, 100u);
  EXPECT_EQ(o->min_amount_out, 190u);
  EXPECT_EQ(o->expiry, kNow + 3600);
  EXPECT_EQ(o->venue, d.venue_id());

  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding - 100);
  EXPECT_EQ(d.tokens.balance_of(kA, kEngine), 100u);
  EXPECT_EQ(d.eng.ledger().locked(kA), 100u);
  EXPECT_TRUE(d.eng.ledger().index().contains(d.venue_id(), ack.id));
}

TEST(EscrowLedger, OrderIdsStrictlyIncrease) {
  Desk d;
  auto a = d.post(kMaker, true, 10, 1);
  auto b = d.post(kMaker2, false, 10, 1);
  auto c = d.post(kMaker, true, 10, 1);
  EXPECT_LT(a.id, b.id);
  EXPECT_LT(b.id, c.id);
}

TEST(EscrowLedger, ZeroAmountIsRejectedWithoutState) {
  Desk d;
  auto ack = d.post(kMaker, true, 0, 190);
  EXPECT_EQ(ack.status, claw::OrderStatus::Rejected);
  EXPECT_EQ(ack.reject_reason, claw::RejectReason::InvalidAmount);
  EXPECT_TRUE(d.eng.ledger().orders().empty());
  EXPECT_EQ(d.eng.ledger().locked(kA), 0u);
  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding);
}

TEST(EscrowLedger, FailedLockLeavesNoPartialState) {
  Desk d;
  auto ack = d.post(kMaker, true, kFunding + 1, 1);
  EXPECT_EQ(ack.reject_reason, claw::RejectReason::TransferFailed);
  EXPECT_TRUE(d.eng.ledger().orders().empty());
  EXPECT_TRUE(d.eng.ledger().index().ids(d.venue_id()).empty());
  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding);
}

TEST(EscrowLedger, RejectsBadDurationAndVenue) {
  Desk d;
  EXPECT_EQ(d.post(kMaker, true, 10, 1, /*duration*/ 0).reject_reason,
            claw::RejectReason::InvalidDuration);

  claw::PostRequest req{};
  req.venue = claw::VenueKey{kB, kA, 3000, 60, kEngine};
  req.amount_in = 10;
  req.duration = 60;
  req.caller = kMaker;
  EXPECT_EQ(d.eng.post_order(req).reject_reason, claw::RejectReason::InvalidVenue);
  EXPECT_TRUE(d.eng.ledger().orders().empty());
}

TEST(EscrowLedger, RecordsCallerOrigin) {
  Desk d;
  auto manual = d.post(kMaker, true, 10, 1, 3600, kNow, /*direct*/ true);
  auto agent = d.post(kMaker, true, 10, 1, 3600, kNow, /*direct*/ false);
  EXPECT_EQ(d.eng.ledger().order(manual.id)->origin, claw::OrderOrigin::Direct);
  EXPECT_EQ(d.eng.ledger().order(agent.id)->origin, claw::OrderOrigin::Agent);
}

TEST(EscrowLedger, CancelRefundsMakerAndUnindexes) {
  Desk d;
  auto ack = d.post(kMaker, true, 100, 190);

  auto c = d.eng.cancel_order(ack.id, d.venue, kMaker);
  ASSERT_EQ(c.status, claw::OrderStatus::Accepted);
  EXPECT_EQ(c.refunded, 100u);

  const auto* o = d.eng.ledger().order(ack.id);
  EXPECT_FALSE(o->active);
  EXPECT_EQ(o->state, claw::OrderState::Cancelled);
  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding);
  EXPECT_EQ(d.eng.ledger().locked(kA), 0u);
  EXPECT_FALSE(d.eng.ledger().index().contains(d.venue_id(), ack.id));
}

TEST(EscrowLedger, CancelValidatesInOrder) {
  Desk d;
  auto ack = d.post(kMaker, true, 100, 190);

  EXPECT_EQ(d.eng.cancel_order(99, d.venue, kMaker).reject_reason, claw::RejectReason::NotFound);
  EXPECT_EQ(d.eng.cancel_order(ack.id, d.venue, kMaker2).reject_reason, claw::RejectReason::Unauthorized);

  auto other = d.venue;
  other.fee = 500;
  EXPECT_EQ(d.eng.cancel_order(ack.id, other, kMaker).reject_reason, claw::RejectReason::VenueMismatch);
  EXPECT_TRUE(d.eng.ledger().order(ack.id)->active);

  ASSERT_EQ(d.eng.cancel_order(ack.id, d.venue, kMaker).status, claw::OrderStatus::Accepted);
  EXPECT_EQ(d.eng.cancel_order(ack.id, d.venue, kMaker).reject_reason, claw::RejectReason::NotActive);
  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding);
}

TEST(EscrowLedger, ExpiredOrderCanStillBeCancelled) {
  Desk d;
  auto ack = d.post(kMaker, true, 100, 190, /*duration*/ 10);
  ASSERT_TRUE(claw::is_expired(*d.eng.ledger().order(ack.id), kNow + 11));

  EXPECT_EQ(d.eng.cancel_order(ack.id, d.venue, kMaker).status, claw::OrderStatus::Accepted);
  EXPECT_EQ(d.tokens.balance_of(kA, kMaker), kFunding);
}

TEST(EscrowLedger, LockedBalanceTracksActiveOrders) {
  Desk d;
  auto a = d.post(kMaker, true, 100, 1);
  d.post(kMaker2, true, 50, 1);
  d.post(kMaker2, false, 70, 1);
  EXPECT_EQ(d.eng.ledger().locked(kA), 150u);
  EXPECT_EQ(d.eng.ledger().locked(kB), 70u);

  d.eng.cancel_order(a.id, d.venue, kMaker);
  EXPECT_EQ(d.eng.ledger().locked(kA), 50u);

  EXPECT_TRUE(claw::escrow_balanced(d.eng.ledger()));
  EXPECT_TRUE(claw::index_consistent(d.eng.ledger()));
  EXPECT_TRUE(claw::custody_covers_escrow(d.eng.ledger(), d.tokens));
}

TEST(EscrowLedger, ReadSurfaceListsByVenueAndMaker) {
  Desk d;
  d.post(kMaker, true, 10, 1);
  d.post(kMaker2, true, 20, 1);
  auto c = d.post(kMaker, false, 30, 1);
  d.eng.cancel_order(c.id, d.venue, kMaker);

  EXPECT_EQ(d.eng.ledger().live_orders(d.venue_id()).size(), 2u);
  EXPECT_EQ(d.eng.ledger().orders_by_maker(kMaker).size(), 2u);  // cancelled kept for audit
  EXPECT_EQ(d.eng.ledger().orders().size(), 3u);
  EXPECT_EQ(d.eng.ledger().order(0), nullptr);
  EXPECT_EQ(d.eng.ledger().order(4), nullptr);
}
