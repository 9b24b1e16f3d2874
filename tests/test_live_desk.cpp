#include <gtest/gtest.h>

#include "claw/live_desk.hpp"

namespace {

constexpr claw::AccountId kMaker = 1001;
constexpr claw::AccountId kTaker = 2001;
constexpr claw::AccountId kAdmin = 0xAD;
constexpr claw::AccountId kBeneficiary = 0xBE;

struct DeskFixture : ::testing::Test {
  claw::Ts t{1'000};
  claw::LiveDesk desk{claw::DeskConfig{}, [this] { return t; }};
  claw::VenueId vid{};

  void SetUp() override {
    desk.register_asset(1, "WETH");
    desk.register_asset(2, "USDC");
    vid = claw::fingerprint(desk.open_venue(2, 1, 3000, 60));
    desk.fund(kMaker, 1, 1'000);
    desk.fund(kTaker, 2, 1'000);
    desk.fund(kBeneficiary, 2, 1'000);
  }
};

} // namespace

TEST_F(DeskFixture, SwapFillsPostedOrder) {
  auto ack = desk.post(vid, kMaker, true, 100, 190, 3600, false);
  ASSERT_EQ(ack.status, claw::OrderStatus::Accepted);
  EXPECT_EQ(desk.locked(1), 100u);

  auto out = desk.swap(vid, kTaker, true, -200);
  ASSERT_TRUE(out.matched());
  EXPECT_EQ(out.surplus, 10u);

  auto fills = desk.recent_fills(10);
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_EQ(fills[0].kind, claw::FillKind::Market);
  EXPECT_EQ(desk.balance_of(1, kTaker), 100u);
  EXPECT_EQ(desk.balance_of(2, kMaker), 190u);
  EXPECT_EQ(desk.order(ack.id)->order.state, claw::OrderState::Filled);
}

TEST_F(DeskFixture, PriceFeedFiresArmedTrigger) {
  auto ack = desk.post(vid, kMaker, true, 100, 190, 3600, true);
  ASSERT_EQ(desk.arm(kMaker, ack.id, 3000, claw::Direction::Lower).reject_reason,
            claw::RejectReason::Unauthorized);

  auto armed = desk.arm(kAdmin, ack.id, 3000, claw::Direction::Lower);
  ASSERT_EQ(armed.status, claw::OrderStatus::Accepted);
  ASSERT_EQ(desk.triggers().size(), 1u);
  EXPECT_EQ(desk.triggers()[0].maker, kMaker);

  EXPECT_TRUE(desk.push_price(3000).report.fired.empty());

  t += 5;
  auto r = desk.push_price(2990);
  ASSERT_EQ(r.report.fired.size(), 1u);
  ASSERT_EQ(r.deliveries.size(), 1u);
  EXPECT_EQ(r.deliveries[0].ack.status, claw::OrderStatus::Accepted);

  auto fills = desk.recent_fills(10);
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_EQ(fills[0].kind, claw::FillKind::Trigger);
  EXPECT_EQ(fills[0].ts, 1'005);
  EXPECT_EQ(desk.balance_of(1, kBeneficiary), 100u);
  EXPECT_EQ(desk.last_price(), 2990);
}

TEST_F(DeskFixture, ViewsReportSymbolsAndExpiry) {
  auto a = desk.post(vid, kMaker, true, 100, 190, 60, false);
  auto b = desk.post(vid, kMaker, true, 100, 190, 3600, false);
  ASSERT_EQ(b.status, claw::OrderStatus::Accepted);

  auto all = desk.orders();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].order.id, b.id);
  EXPECT_EQ(all[0].sell_symbol, "WETH");
  EXPECT_EQ(all[0].buy_symbol, "USDC");

  EXPECT_EQ(desk.venue_orders(vid).size(), 2u);
  EXPECT_EQ(desk.venues().size(), 1u);

  t += 61;
  EXPECT_TRUE(desk.order(a.id)->expired);
  EXPECT_FALSE(desk.order(b.id)->expired);
  EXPECT_FALSE(desk.order(999).has_value());
}

TEST_F(DeskFixture, UnknownVenueIsRejected) {
  EXPECT_EQ(desk.post(vid + 1, kMaker, true, 100, 190, 3600, false).reject_reason,
            claw::RejectReason::InvalidVenue);
  EXPECT_EQ(desk.swap(vid + 1, kTaker, true, -200).reject_reason,
            claw::RejectReason::InvalidVenue);
}

TEST_F(DeskFixture, CancelChecksIdAndOwnerBeforeVenue) {
  EXPECT_EQ(desk.cancel(vid + 1, kMaker, 1).reject_reason, claw::RejectReason::NotFound);

  auto ack = desk.post(vid, kMaker, true, 100, 190, 3600, false);
  EXPECT_EQ(desk.cancel(vid + 1, kTaker, ack.id).reject_reason, claw::RejectReason::Unauthorized);
  EXPECT_EQ(desk.cancel(vid + 1, kMaker, ack.id).reject_reason, claw::RejectReason::VenueMismatch);
  EXPECT_EQ(desk.locked(1), 100u);
}

TEST_F(DeskFixture, MakerCancelRefunds) {
  auto ack = desk.post(vid, kMaker, true, 100, 190, 3600, false);
  auto c = desk.cancel(vid, kMaker, ack.id);
  EXPECT_EQ(c.status, claw::OrderStatus::Accepted);
  EXPECT_EQ(c.refunded, 100u);
  EXPECT_EQ(desk.balance_of(1, kMaker), 1'000u);
  EXPECT_EQ(desk.locked(1), 0u);
}
