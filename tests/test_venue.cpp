#include <gtest/gtest.h>
#include "claw/venue.hpp"

TEST(Venue, FingerprintIsDeterministic) {
  claw::VenueKey k{1, 2, 3000, 60, 0xE0};
  claw::VenueKey same{1, 2, 3000, 60, 0xE0};
  EXPECT_EQ(claw::fingerprint(k), claw::fingerprint(same));
}

TEST(Venue, FingerprintCoversEveryField) {
  const claw::VenueKey base{1, 2, 3000, 60, 0xE0};
  const auto fp = claw::fingerprint(base);

  auto k = base; k.asset1 = 3;        EXPECT_NE(claw::fingerprint(k), fp);
  k = base; k.fee = 500;              EXPECT_NE(claw::fingerprint(k), fp);
  k = base; k.tick_spacing = 10;      EXPECT_NE(claw::fingerprint(k), fp);
  k = base; k.hooks = 0xE1;           EXPECT_NE(claw::fingerprint(k), fp);
}

TEST(Venue, ValidityRequiresOrderedPairAndSaneParameters) {
  EXPECT_TRUE(claw::is_valid_venue(claw::VenueKey{1, 2, 3000, 60, 0}));
  EXPECT_FALSE(claw::is_valid_venue(claw::VenueKey{2, 1, 3000, 60, 0}));
  EXPECT_FALSE(claw::is_valid_venue(claw::VenueKey{1, 1, 3000, 60, 0}));
  EXPECT_FALSE(claw::is_valid_venue(claw::VenueKey{1, 2, claw::kMaxFee + 1, 60, 0}));
  EXPECT_FALSE(claw::is_valid_venue(claw::VenueKey{1, 2, 3000, 0, 0}));
}

TEST(Venue, SellAndBuyAssetFollowSide) {
  const claw::VenueKey k{7, 9, 3000, 60, 0};
  EXPECT_EQ(claw::sell_asset(k, true), 7u);
  EXPECT_EQ(claw::buy_asset(k, true), 9u);
  EXPECT_EQ(claw::sell_asset(k, false), 9u);
  EXPECT_EQ(claw::buy_asset(k, false), 7u);
}
