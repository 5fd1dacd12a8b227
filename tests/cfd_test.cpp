// =============================================================================
// cfd_test.cpp
// =============================================================================
// Unit tests for the inverse BTCUSD contract math in tradecalc::cfd.
//
// Validates:
//   - Margin and its inverse (quantity) for known prices and leverages
//   - Long and short liquidation prices, including the short-side cap and
//     entries at or above it
//   - Order-matching fee scaling and rounding to whole sats
//   - PnL sign per direction and the clamp to the posted margins
//   - Non-positive price or leverage yields std::nullopt, never a throw
// =============================================================================

#include "tradecalc/calc/cfd.hpp"
#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"

#include <gtest/gtest.h>

using tradecalc::domain::Amount;
using tradecalc::domain::Direction;
namespace cfd = tradecalc::cfd;

// -----------------------------------------------------------------------------
// 1. 100 USD at 50 000 USD/BTC with 2x leverage needs 0.001 BTC.
// -----------------------------------------------------------------------------
TEST(CfdTest, MarginForKnownInputs) {
  auto margin = cfd::calculateMargin(50'000.0, 100.0, 2.0);

  ASSERT_TRUE(margin.has_value());
  EXPECT_EQ(margin->sats, 100'000);
}

// -----------------------------------------------------------------------------
// 2. Margin is inversely proportional to leverage.
// -----------------------------------------------------------------------------
TEST(CfdTest, MarginHalvesWhenLeverageDoubles) {
  auto at_one = cfd::calculateMargin(40'000.0, 1'000.0, 1.0);
  auto at_two = cfd::calculateMargin(40'000.0, 1'000.0, 2.0);

  ASSERT_TRUE(at_one && at_two);
  EXPECT_EQ(at_one->sats, 2'500'000);
  EXPECT_EQ(at_two->sats, 1'250'000);
}

// -----------------------------------------------------------------------------
// 3. Zero quantity costs zero margin; a negative quantity is rejected.
// -----------------------------------------------------------------------------
TEST(CfdTest, MarginZeroAndNegativeQuantity) {
  auto zero = cfd::calculateMargin(50'000.0, 0.0, 2.0);
  ASSERT_TRUE(zero.has_value());
  EXPECT_EQ(zero->sats, 0);

  EXPECT_FALSE(cfd::calculateMargin(50'000.0, -1.0, 2.0).has_value());
}

// -----------------------------------------------------------------------------
// 4. Division guards: non-positive price or leverage yields nullopt.
// -----------------------------------------------------------------------------
TEST(CfdTest, NonPositivePriceOrLeverageYieldsNullopt) {
  EXPECT_FALSE(cfd::calculateMargin(0.0, 100.0, 2.0).has_value());
  EXPECT_FALSE(cfd::calculateMargin(-1.0, 100.0, 2.0).has_value());
  EXPECT_FALSE(cfd::calculateMargin(50'000.0, 100.0, 0.0).has_value());

  EXPECT_FALSE(cfd::calculateQuantity(0.0, Amount{1'000}, 2.0).has_value());
  EXPECT_FALSE(cfd::calculateQuantity(50'000.0, Amount{1'000}, 0.0).has_value());

  EXPECT_FALSE(
      cfd::calculateLiquidationPrice(0.0, 2.0, Direction::Long, 0.05).has_value());
  EXPECT_FALSE(cfd::orderMatchingFee(100.0, 0.0, 0.003).has_value());
}

// -----------------------------------------------------------------------------
// 5. Quantity is the inverse of margin.
// -----------------------------------------------------------------------------
TEST(CfdTest, QuantityInvertsMargin) {
  auto quantity = cfd::calculateQuantity(50'000.0, Amount{100'000}, 2.0);

  ASSERT_TRUE(quantity.has_value());
  EXPECT_NEAR(*quantity, 100.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 6. Long liquidation sits below the entry price, short above it.
//    P=50 000, L=2, mmr=0.05:
//      long  = 100 000 / 2.9
//      short = 100 000 / 1.1
// -----------------------------------------------------------------------------
TEST(CfdTest, LiquidationPricesAtTwoX) {
  auto long_liq =
      cfd::calculateLiquidationPrice(50'000.0, 2.0, Direction::Long, 0.05);
  auto short_liq =
      cfd::calculateLiquidationPrice(50'000.0, 2.0, Direction::Short, 0.05);

  ASSERT_TRUE(long_liq && short_liq);
  EXPECT_NEAR(*long_liq, 100'000.0 / 2.9, 1e-6);
  EXPECT_NEAR(*short_liq, 100'000.0 / 1.1, 1e-6);
  EXPECT_LT(*long_liq, 50'000.0);
  EXPECT_GT(*short_liq, 50'000.0);
}

// -----------------------------------------------------------------------------
// 7. Without maintenance margin a 1x long is liquidated at half the price.
// -----------------------------------------------------------------------------
TEST(CfdTest, LongLiquidationAtOneXWithoutMaintenanceMargin) {
  EXPECT_DOUBLE_EQ(cfd::calculateLongLiquidationPrice(1.0, 30'000.0, 0.0),
                   15'000.0);
}

// -----------------------------------------------------------------------------
// 8. A 1x short without maintenance margin can never be liquidated; the
//    result is the maximum representable price.
// -----------------------------------------------------------------------------
TEST(CfdTest, ShortLiquidationIsCappedAtMaxPrice) {
  EXPECT_DOUBLE_EQ(cfd::calculateShortLiquidationPrice(1.0, 30'000.0, 0.0),
                   tradecalc::domain::kBtcUsdMaxPrice);

  // Very close to the singularity the raw formula exceeds the cap.
  EXPECT_DOUBLE_EQ(
      cfd::calculateShortLiquidationPrice(1.0, 900'000.0, 0.01),
      tradecalc::domain::kBtcUsdMaxPrice);
}

// -----------------------------------------------------------------------------
// 9. Higher leverage moves the liquidation price towards the entry price.
// -----------------------------------------------------------------------------
TEST(CfdTest, LiquidationApproachesEntryWithLeverage) {
  const double price = 30'000.0;
  double previous_long = 0.0;
  double previous_short = tradecalc::domain::kBtcUsdMaxPrice;

  for (double leverage : {1.0, 2.0, 5.0, 10.0}) {
    double long_liq = cfd::calculateLongLiquidationPrice(leverage, price, 0.05);
    double short_liq =
        cfd::calculateShortLiquidationPrice(leverage, price, 0.05);
    EXPECT_GT(long_liq, previous_long) << "leverage " << leverage;
    EXPECT_LT(short_liq, previous_short) << "leverage " << leverage;
    previous_long = long_liq;
    previous_short = short_liq;
  }
}

// -----------------------------------------------------------------------------
// 10. Fee: 100 USD at 50 000 with 0.3 % is 0.000006 BTC.
// -----------------------------------------------------------------------------
TEST(CfdTest, OrderMatchingFeeKnownValue) {
  auto fee = cfd::orderMatchingFee(100.0, 50'000.0, 0.003);

  ASSERT_TRUE(fee.has_value());
  EXPECT_EQ(fee->sats, 600);
}

// -----------------------------------------------------------------------------
// 11. Fee is non-negative and non-decreasing in quantity.
// -----------------------------------------------------------------------------
TEST(CfdTest, OrderMatchingFeeMonotoneInQuantity) {
  std::int64_t previous = 0;
  for (double quantity : {0.0, 1.0, 10.0, 160.0, 1'000.0, 25'000.0}) {
    auto fee = cfd::orderMatchingFee(quantity, 30'209.0, 0.003);
    ASSERT_TRUE(fee.has_value());
    EXPECT_GE(fee->sats, previous) << "quantity " << quantity;
    previous = fee->sats;
  }

  auto zero = cfd::orderMatchingFee(0.0, 30'209.0, 0.003);
  EXPECT_EQ(zero->sats, 0);
}

// -----------------------------------------------------------------------------
// 12. PnL: a long gains what the short loses when the price rises.
//     100 USD, 50 000 → 60 000: 100 * (1/50 000 - 1/60 000) BTC.
// -----------------------------------------------------------------------------
TEST(CfdTest, PnlIsSymmetricBetweenDirections) {
  auto long_pnl = cfd::calculatePnl(50'000.0, 60'000.0, 100.0, Direction::Long,
                                    Amount{100'000}, Amount{100'000});
  auto short_pnl =
      cfd::calculatePnl(50'000.0, 60'000.0, 100.0, Direction::Short,
                        Amount{100'000}, Amount{100'000});

  ASSERT_TRUE(long_pnl && short_pnl);
  EXPECT_EQ(*long_pnl, 33'333);
  EXPECT_EQ(*short_pnl, -33'333);
}

// -----------------------------------------------------------------------------
// 13. PnL is bounded by the margins posted by each side.
// -----------------------------------------------------------------------------
TEST(CfdTest, PnlIsClampedToMargins) {
  // Price quadruples: uncapped long gain is 150 000 sats, short only put up
  // 100 000.
  auto long_win = cfd::calculatePnl(50'000.0, 200'000.0, 100.0,
                                    Direction::Long, Amount{100'000},
                                    Amount{100'000});
  ASSERT_TRUE(long_win.has_value());
  EXPECT_EQ(*long_win, 100'000);

  // Price halves: uncapped long loss is 200 000 sats, long only put up
  // 100 000.
  auto long_loss = cfd::calculatePnl(50'000.0, 25'000.0, 100.0,
                                     Direction::Long, Amount{100'000},
                                     Amount{100'000});
  ASSERT_TRUE(long_loss.has_value());
  EXPECT_EQ(*long_loss, -100'000);

  auto short_win = cfd::calculatePnl(50'000.0, 25'000.0, 100.0,
                                     Direction::Short, Amount{100'000},
                                     Amount{100'000});
  ASSERT_TRUE(short_win.has_value());
  EXPECT_EQ(*short_win, 100'000);
}

// -----------------------------------------------------------------------------
// 14. Unchanged price means zero PnL.
// -----------------------------------------------------------------------------
TEST(CfdTest, PnlZeroWhenPriceUnchanged) {
  auto pnl = cfd::calculatePnl(42'000.0, 42'000.0, 5'000.0, Direction::Short,
                               Amount{50'000}, Amount{50'000});
  ASSERT_TRUE(pnl.has_value());
  EXPECT_EQ(*pnl, 0);
}

// -----------------------------------------------------------------------------
// 15. A short entered at or above the maximum price has no liquidation price
//     above its entry, so none is reported. The long side is unaffected.
// -----------------------------------------------------------------------------
TEST(CfdTest, ShortAtOrAboveMaxPriceHasNoLiquidationPrice) {
  const double max_price = tradecalc::domain::kBtcUsdMaxPrice;

  EXPECT_FALSE(cfd::calculateLiquidationPrice(max_price, 2.0, Direction::Short,
                                              0.05)
                   .has_value());
  EXPECT_FALSE(cfd::calculateLiquidationPrice(1'200'000.0, 2.0,
                                              Direction::Short, 0.05)
                   .has_value());

  auto long_liquidation = cfd::calculateLiquidationPrice(
      1'200'000.0, 2.0, Direction::Long, 0.05);
  ASSERT_TRUE(long_liquidation.has_value());
  EXPECT_LT(*long_liquidation, 1'200'000.0);

  auto below_cap = cfd::calculateLiquidationPrice(1'000'000.0, 2.0,
                                                  Direction::Short, 0.05);
  ASSERT_TRUE(below_cap.has_value());
  EXPECT_GT(*below_cap, 1'000'000.0);
}
