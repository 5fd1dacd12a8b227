// =============================================================================
// expiry_schedule_test.cpp
// =============================================================================
// Unit tests for isEligibleForRollover() and calculateNextExpiry().
//
// Mainnet contracts expire on Sunday 15:00 UTC; the rollover window runs
// from Friday 15:00 to Sunday 15:00. Other networks expire at midnight UTC
// with an 8 hour window before it.
//
// Reference dates (UTC, August 2023):
//   1691573423  Wed 09 Aug 09:30:23
//   1691766000  Fri 11 Aug 15:00:00
//   1691856000  Sat 12 Aug 16:00:00
//   1691938800  Sun 13 Aug 15:00:00
//   1692543600  Sun 20 Aug 15:00:00
// =============================================================================

#include "tradecalc/domain/trading_config.hpp"
#include "tradecalc/time/expiry_schedule.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using tradecalc::calculateNextExpiry;
using tradecalc::isEligibleForRollover;
using tradecalc::Timestamp;
using tradecalc::domain::Network;

namespace {

Timestamp fromUnix(std::int64_t seconds) {
  return tradecalc::ms_to_timestamp(seconds * 1'000);
}

std::int64_t toUnix(Timestamp timestamp) {
  return tradecalc::timestamp_to_ms(timestamp) / 1'000;
}

constexpr std::int64_t kWednesdayMidnight = 1'691'539'200;  // Wed 09 Aug 00:00
constexpr std::int64_t kHour = 3'600;

}  // namespace

// -----------------------------------------------------------------------------
// 1. Rollover window boundaries on mainnet.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, MainnetRolloverWindow) {
  EXPECT_FALSE(isEligibleForRollover(fromUnix(1'691'573'423), Network::Bitcoin));

  EXPECT_FALSE(isEligibleForRollover(fromUnix(1'691'765'999), Network::Bitcoin));
  EXPECT_TRUE(isEligibleForRollover(fromUnix(1'691'766'000), Network::Bitcoin));
  EXPECT_TRUE(isEligibleForRollover(fromUnix(1'691'766'001), Network::Bitcoin));

  EXPECT_TRUE(isEligibleForRollover(fromUnix(1'691'856'000), Network::Bitcoin));

  EXPECT_TRUE(isEligibleForRollover(fromUnix(1'691'938'799), Network::Bitcoin));
  EXPECT_FALSE(isEligibleForRollover(fromUnix(1'691'938'800), Network::Bitcoin));
  EXPECT_FALSE(isEligibleForRollover(fromUnix(1'691'938'801), Network::Bitcoin));
}

// -----------------------------------------------------------------------------
// 2. Before the window the expiry is the coming Sunday.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, MainnetExpiryBeforeFriday) {
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'573'423),
                                       Network::Bitcoin)),
            1'691'938'800);
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'765'999),
                                       Network::Bitcoin)),
            1'691'938'800);
}

// -----------------------------------------------------------------------------
// 3. Inside the window the expiry moves to the Sunday after.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, MainnetExpiryInsideWindow) {
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'766'000),
                                       Network::Bitcoin)),
            1'692'543'600);
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'766'001),
                                       Network::Bitcoin)),
            1'692'543'600);
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'856'000),
                                       Network::Bitcoin)),
            1'692'543'600);
}

// -----------------------------------------------------------------------------
// 4. Sunday after 15:00 expires a week later.
//    1691337600 = Sun 06 Aug 16:00 → Sun 13 Aug 15:00.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, MainnetExpiryAfterSundayExpiry) {
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(1'691'337'600),
                                       Network::Bitcoin)),
            1'691'938'800);
}

// -----------------------------------------------------------------------------
// 5. Every mainnet expiry lands on a Sunday at 15:00 in the future.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, MainnetExpiryAlwaysSundayAfternoon) {
  for (std::int64_t t = kWednesdayMidnight; t < kWednesdayMidnight + 14 * 24 * kHour;
       t += 5 * kHour + 17) {
    std::int64_t expiry = toUnix(calculateNextExpiry(fromUnix(t), Network::Bitcoin));
    EXPECT_GT(expiry, t);
    EXPECT_LE(expiry - t, 14 * 24 * kHour);
    // Sun 13 Aug 15:00 is a valid expiry; all others are whole weeks away.
    EXPECT_EQ((expiry - 1'691'938'800) % (7 * 24 * kHour), 0) << "from " << t;
  }
}

// -----------------------------------------------------------------------------
// 6. Regtest: next midnight, or the one after within 8 hours of it.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, RegtestMidnightExpiry) {
  const std::int64_t next_midnight = kWednesdayMidnight + 24 * kHour;

  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(kWednesdayMidnight + 12 * kHour),
                                       Network::Regtest)),
            next_midnight);
  EXPECT_EQ(toUnix(calculateNextExpiry(fromUnix(kWednesdayMidnight + 20 * kHour),
                                       Network::Regtest)),
            next_midnight + 24 * kHour);
}

// -----------------------------------------------------------------------------
// 7. Regtest rollover window starts at 16:00 UTC (exclusive).
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, RegtestRolloverWindow) {
  EXPECT_FALSE(isEligibleForRollover(fromUnix(kWednesdayMidnight + 16 * kHour),
                                     Network::Regtest));
  EXPECT_TRUE(isEligibleForRollover(fromUnix(kWednesdayMidnight + 17 * kHour),
                                    Network::Regtest));
}

// -----------------------------------------------------------------------------
// 8. Testnet and signet follow the daily schedule too.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, NonMainnetNetworksAreDaily) {
  const Timestamp noon = fromUnix(kWednesdayMidnight + 12 * kHour);
  const std::int64_t next_midnight = kWednesdayMidnight + 24 * kHour;

  EXPECT_EQ(toUnix(calculateNextExpiry(noon, Network::Testnet)), next_midnight);
  EXPECT_EQ(toUnix(calculateNextExpiry(noon, Network::Signet)), next_midnight);
}

// -----------------------------------------------------------------------------
// 9. UTC calendar split: weekday and time of day, including before 1970.
// -----------------------------------------------------------------------------
TEST(ExpiryScheduleTest, UtcDaySplit) {
  auto wednesday = tradecalc::to_utc_day(fromUnix(1'691'573'423));
  EXPECT_EQ(wednesday.weekday(), tradecalc::Weekday::Wednesday);
  EXPECT_EQ(wednesday.seconds_of_day, 9 * kHour + 30 * 60 + 23);
  EXPECT_EQ(tradecalc::from_utc_day(wednesday.days_since_epoch, 0),
            fromUnix(kWednesdayMidnight));

  auto epoch = tradecalc::to_utc_day(fromUnix(0));
  EXPECT_EQ(epoch.weekday(), tradecalc::Weekday::Thursday);

  // One second before the epoch is Wednesday 23:59:59.
  auto before_epoch = tradecalc::to_utc_day(fromUnix(-1));
  EXPECT_EQ(before_epoch.days_since_epoch, -1);
  EXPECT_EQ(before_epoch.seconds_of_day, 24 * kHour - 1);
  EXPECT_EQ(before_epoch.weekday(), tradecalc::Weekday::Wednesday);
}
