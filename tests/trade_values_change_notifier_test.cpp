// =============================================================================
// trade_values_change_notifier_test.cpp
// =============================================================================
// Unit tests for tradecalc::TradeValuesChangeNotifier.
//
// Validates:
//   - Initial state of both sides
//   - Price routing: ask → long, bid → short
//   - Notification counts: at most one event per price tick, none when the
//     tick changes nothing, exactly one per user edit
//   - Sequence ids increase by one per event
//   - Counterparty margin preview does not touch the stored values
//   - Open quantity netting and max-quantity refresh
//
// Events are observed through a real EventBus; publish() is synchronous, so
// every event has been delivered when the notifier call returns.
// =============================================================================

#include "tradecalc/domain/channel_trade_constraints.hpp"
#include "tradecalc/domain/trading_config.hpp"
#include "tradecalc/eventbus/event_bus.hpp"
#include "tradecalc/events/event_types.hpp"
#include "tradecalc/service/configured_channel_info_provider.hpp"
#include "tradecalc/service/trade_values_service.hpp"
#include "tradecalc/time/simulation_time_provider.hpp"
#include "tradecalc/trade/trade_values_change_notifier.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using tradecalc::TradeValuesChangedEvent;
using tradecalc::domain::Amount;
using tradecalc::domain::Direction;
using tradecalc::domain::Price;
using tradecalc::domain::PrimaryField;
using Cause = TradeValuesChangedEvent::Cause;

namespace {

tradecalc::domain::ChannelTradeConstraints channelWithBalance() {
  tradecalc::domain::ChannelTradeConstraints constraints;
  constraints.max_local_balance = Amount{280'000};
  constraints.max_counterparty_balance = Amount{3'000'000};
  constraints.is_channel_balance = true;
  constraints.min_margin = Amount{1'000};
  return constraints;
}

Price makePrice(std::optional<double> ask, std::optional<double> bid) {
  Price price;
  price.ask = ask;
  price.bid = bid;
  return price;
}

}  // namespace

class TradeValuesChangeNotifierTest : public ::testing::Test {
 protected:
  void SetUp() override {
    bus.subscribe<TradeValuesChangedEvent>(
        [this](const TradeValuesChangedEvent& event) {
          events.push_back(event);
        });
  }

  tradecalc::domain::TradingConfig config;
  tradecalc::SimulationTimeProvider clock{1'691'573'423'000};
  tradecalc::ConfiguredChannelInfoProvider channel_info{channelWithBalance()};
  tradecalc::TradeValuesService service{config, channel_info, clock};
  tradecalc::EventBus bus;
  tradecalc::TradeValuesChangeNotifier notifier{service, channel_info, bus,
                                                2.0};

  std::vector<TradeValuesChangedEvent> events;
};

// -----------------------------------------------------------------------------
// 1. Both sides start margin-primary with the minimum margin pending, the
//    default leverage and no price. Construction publishes nothing.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, InitialState) {
  EXPECT_TRUE(events.empty());

  for (Direction direction : {Direction::Long, Direction::Short}) {
    auto side = notifier.snapshot(direction);
    EXPECT_EQ(side.direction, direction);
    EXPECT_EQ(side.primary_field, PrimaryField::Margin);
    EXPECT_DOUBLE_EQ(side.leverage, 2.0);
    EXPECT_FALSE(side.price.has_value());
    EXPECT_FALSE(side.margin.has_value());
    EXPECT_FALSE(side.max_quantity.has_value());
    EXPECT_DOUBLE_EQ(side.quantity, 0.0);
  }
}

// -----------------------------------------------------------------------------
// 2. An ask-only tick updates the long side only. The pending minimum margin
//    becomes the margin and fixes the quantity:
//    0.00001 BTC * 50 000 * 2 = 1 USD.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, AskOnlyTickUpdatesLongSide) {
  notifier.updatePrice(makePrice(50'000.0, std::nullopt));

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].cause, Cause::Price);

  const auto& long_side = events[0].long_values;
  ASSERT_TRUE(long_side.price.has_value());
  EXPECT_DOUBLE_EQ(*long_side.price, 50'000.0);
  ASSERT_TRUE(long_side.margin.has_value());
  EXPECT_EQ(long_side.margin->sats, 1'000);
  EXPECT_DOUBLE_EQ(long_side.quantity, 1.0);
  EXPECT_TRUE(long_side.liquidation_price.has_value());
  EXPECT_TRUE(long_side.max_quantity.has_value());

  const auto& short_side = events[0].short_values;
  EXPECT_FALSE(short_side.price.has_value());
  EXPECT_FALSE(short_side.margin.has_value());
}

// -----------------------------------------------------------------------------
// 3. A tick changing both sides is one event; repeating it is none.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, OneEventPerTickAndNoneWhenUnchanged) {
  const Price tick = makePrice(50'010.0, 49'990.0);

  notifier.updatePrice(tick);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_DOUBLE_EQ(*events[0].long_values.price, 50'010.0);
  EXPECT_DOUBLE_EQ(*events[0].short_values.price, 49'990.0);

  notifier.updatePrice(tick);
  EXPECT_EQ(events.size(), 1u);

  // Only the bid moves: still exactly one event.
  notifier.updatePrice(makePrice(50'010.0, 49'995.0));
  ASSERT_EQ(events.size(), 2u);
  EXPECT_DOUBLE_EQ(*events[1].long_values.price, 50'010.0);
  EXPECT_DOUBLE_EQ(*events[1].short_values.price, 49'995.0);
}

// -----------------------------------------------------------------------------
// 4. Losing a price is a change too.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, PriceBecomingUnknownNotifies) {
  notifier.updatePrice(makePrice(50'000.0, 49'990.0));
  notifier.updatePrice(makePrice(std::nullopt, 49'990.0));

  ASSERT_EQ(events.size(), 2u);
  EXPECT_FALSE(events[1].long_values.price.has_value());
  EXPECT_FALSE(events[1].long_values.margin.has_value());
  EXPECT_FALSE(events[1].long_values.max_quantity.has_value());
  EXPECT_TRUE(events[1].short_values.price.has_value());
}

// -----------------------------------------------------------------------------
// 5. Every user edit publishes exactly one event with its cause, and sequence
//    ids count up from one.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, EachEditPublishesOneEvent) {
  notifier.updatePrice(makePrice(50'000.0, 49'990.0));
  notifier.updateQuantity(Direction::Long, 100.0);
  notifier.updateContracts(Direction::Short, 200.0);
  notifier.updateMargin(Direction::Long, Amount{50'000});
  notifier.updateLeverage(Direction::Short, 5.0);
  notifier.recalculateMaxQuantity();

  const std::vector<Cause> expected{Cause::Price,    Cause::Quantity,
                                    Cause::Contracts, Cause::Margin,
                                    Cause::Leverage, Cause::MaxQuantity};
  ASSERT_EQ(events.size(), expected.size());

  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].cause, expected[i]) << "event " << i;
    EXPECT_EQ(events[i].sequence_id, i + 1) << "event " << i;
  }
}

// -----------------------------------------------------------------------------
// 6. Edits are routed to the requested side only.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, EditsOnlyTouchTheirSide) {
  notifier.updatePrice(makePrice(50'000.0, 50'000.0));
  const auto short_before = notifier.snapshot(Direction::Short);

  notifier.updateQuantity(Direction::Long, 100.0);

  auto long_side = notifier.snapshot(Direction::Long);
  EXPECT_DOUBLE_EQ(long_side.quantity, 100.0);
  ASSERT_TRUE(long_side.margin.has_value());
  EXPECT_EQ(long_side.margin->sats, 100'000);

  auto short_after = notifier.snapshot(Direction::Short);
  EXPECT_DOUBLE_EQ(short_after.quantity, short_before.quantity);
  EXPECT_EQ(short_after.margin, short_before.margin);

  // The event carries both sides as they are after the edit.
  ASSERT_FALSE(events.empty());
  EXPECT_DOUBLE_EQ(events.back().long_values.quantity, 100.0);
  EXPECT_EQ(events.back().short_values.margin, short_before.margin);
}

// -----------------------------------------------------------------------------
// 7. Counterparty margin: 100 USD at 50 000 with 1x is 200 000 sats. Neither
//    overload changes the stored values or publishes.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, CounterpartyMarginIsPure) {
  auto explicit_margin =
      notifier.counterpartyMargin(Direction::Long, 1.0, 50'000.0, 100.0);
  ASSERT_TRUE(explicit_margin.has_value());
  EXPECT_EQ(explicit_margin->sats, 200'000);

  EXPECT_FALSE(notifier.counterpartyMargin(Direction::Long, 1.0, std::nullopt,
                                           100.0)
                   .has_value());

  notifier.updatePrice(makePrice(50'000.0, 50'000.0));
  notifier.updateQuantity(Direction::Long, 100.0);
  const auto before = notifier.snapshot(Direction::Long);
  const auto published = events.size();

  auto current_margin = notifier.counterpartyMargin(Direction::Long, 1.0);
  ASSERT_TRUE(current_margin.has_value());
  EXPECT_EQ(current_margin->sats, 200'000);

  const auto after = notifier.snapshot(Direction::Long);
  EXPECT_EQ(after.margin, before.margin);
  EXPECT_DOUBLE_EQ(after.leverage, before.leverage);
  EXPECT_EQ(events.size(), published);
}

// -----------------------------------------------------------------------------
// 8. The fee follows the contracts: 100 USD at 50 000 with 0.3 % = 600 sats.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, OrderMatchingFeeFollowsContracts) {
  EXPECT_FALSE(notifier.orderMatchingFee(Direction::Long).has_value());

  notifier.updatePrice(makePrice(50'000.0, 50'000.0));
  notifier.updateContracts(Direction::Long, 100.0);

  auto fee = notifier.orderMatchingFee(Direction::Long);
  ASSERT_TRUE(fee.has_value());
  EXPECT_EQ(fee->sats, 600);
}

// -----------------------------------------------------------------------------
// 9. setOpenQuantity is silent and nets the next contracts entry:
//    150 contracts against 100 open leaves 50 USD needing margin, while the
//    fee is charged on all 150.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, OpenQuantityNetsNextContracts) {
  notifier.updatePrice(makePrice(50'000.0, 50'000.0));
  const auto published = events.size();

  notifier.setOpenQuantity(Direction::Short, 100.0);
  EXPECT_EQ(events.size(), published);

  notifier.updateContracts(Direction::Short, 150.0);

  auto short_side = notifier.snapshot(Direction::Short);
  EXPECT_DOUBLE_EQ(short_side.contracts, 150.0);
  EXPECT_DOUBLE_EQ(short_side.open_quantity, 100.0);
  EXPECT_DOUBLE_EQ(short_side.quantity, 50.0);
  ASSERT_TRUE(short_side.margin.has_value());
  EXPECT_EQ(short_side.margin->sats, 50'000);
  ASSERT_TRUE(short_side.fee.has_value());
  EXPECT_EQ(short_side.fee->sats, 900);
}

// -----------------------------------------------------------------------------
// 10. recalculateMaxQuantity picks up new channel constraints.
//     280 000 sats at 30 209 with 2x → 168 USD.
// -----------------------------------------------------------------------------
TEST_F(TradeValuesChangeNotifierTest, RecalculateMaxQuantityAfterChannelUpdate) {
  notifier.updatePrice(makePrice(30'209.0, 30'209.0));
  auto before = notifier.snapshot(Direction::Long);
  ASSERT_TRUE(before.max_quantity.has_value());
  EXPECT_DOUBLE_EQ(*before.max_quantity, 168.0);

  auto constraints = channelWithBalance();
  constraints.max_local_balance = Amount{560'000};
  channel_info.setChannelTradeConstraints(constraints);

  // Cached until asked to refresh.
  EXPECT_DOUBLE_EQ(*notifier.snapshot(Direction::Long).max_quantity, 168.0);

  notifier.recalculateMaxQuantity();
  ASSERT_EQ(events.back().cause, Cause::MaxQuantity);

  auto after = notifier.snapshot(Direction::Long);
  ASSERT_TRUE(after.max_quantity.has_value());
  EXPECT_GT(*after.max_quantity, *before.max_quantity);
  EXPECT_DOUBLE_EQ(*events.back().long_values.max_quantity,
                   *after.max_quantity);
}
