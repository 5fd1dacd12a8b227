#include "tradecalc/calc/max_quantity.hpp"
#include "tradecalc/calc/cfd.hpp"

#include <algorithm>
#include <cmath>

namespace tradecalc {
namespace cfd {

double calculateMaxQuantity(const MaxQuantityInputs& inputs) {
  if (inputs.price <= 0.0) {
    return 0.0;
  }

  const domain::Amount on_chain_fees =
      inputs.on_chain_fee_estimate.value_or(domain::Amount::zero());

  const domain::Amount max_coordinator_margin = domain::saturatingSub(
      domain::saturatingSub(inputs.max_coordinator_margin, on_chain_fees),
      inputs.accumulated_order_matching_fees);
  const domain::Amount max_trader_margin =
      domain::saturatingSub(inputs.max_trader_margin, on_chain_fees);

  const double max_trader_quantity =
      calculateQuantity(inputs.price, max_trader_margin, inputs.trader_leverage)
          .value_or(0.0);
  const double max_coordinator_quantity =
      calculateQuantity(inputs.price, max_coordinator_margin,
                        inputs.coordinator_leverage)
          .value_or(0.0);

  // The side that can afford less bounds the trade.
  double quantity = max_trader_quantity;
  domain::Amount max_margin = max_trader_margin;
  double leverage = inputs.trader_leverage;
  if (max_trader_quantity > max_coordinator_quantity) {
    quantity = max_coordinator_quantity;
    max_margin = max_coordinator_margin;
    leverage = inputs.coordinator_leverage;
  }

  const domain::Amount fee =
      orderMatchingFee(quantity + inputs.open_quantity, inputs.price,
                       inputs.order_matching_fee_rate)
          .value_or(domain::Amount::zero());

  const domain::Amount margin_without_fee =
      domain::saturatingSub(max_margin, fee);

  const double max_quantity =
      calculateQuantity(inputs.price, margin_without_fee, leverage)
          .value_or(0.0);

  return std::max(0.0, std::floor(max_quantity + inputs.open_quantity));
}

double maxQuantity(double price, double trader_leverage,
                   domain::Direction trader_direction,
                   const domain::ChannelTradeConstraints& constraints,
                   const std::optional<domain::OpenPosition>& position,
                   double order_matching_fee_rate) {
  MaxQuantityInputs inputs;
  inputs.price = price;
  inputs.coordinator_leverage = constraints.coordinator_leverage;
  inputs.trader_leverage = trader_leverage;
  inputs.order_matching_fee_rate = order_matching_fee_rate;

  if (!constraints.is_channel_balance) {
    // Opening a channel: reserve the channel fee reserve and twice the
    // funding transaction fee estimate.
    inputs.on_chain_fee_estimate = constraints.estimated_fee_reserve +
                                   constraints.estimated_funding_tx_fee +
                                   constraints.estimated_funding_tx_fee;
  }

  if (position) {
    inputs.accumulated_order_matching_fees = position->order_matching_fees;
  }

  const bool reduces_position =
      position && position->direction != trader_direction;

  if (!reduces_position) {
    inputs.max_coordinator_margin = constraints.max_counterparty_balance;
    inputs.max_trader_margin = constraints.max_local_balance;
    return calculateMaxQuantity(inputs);
  }

  const domain::Amount total_collateral =
      constraints.total_collateral.value_or(domain::Amount::zero());
  const domain::Amount total_balance =
      constraints.max_counterparty_balance + constraints.max_local_balance;
  const domain::Amount trader_margin = position->collateral;
  const domain::Amount coordinator_margin =
      domain::saturatingSub(total_collateral, total_balance + trader_margin);

  const double long_leverage = position->direction == domain::Direction::Long
                                   ? position->leverage
                                   : constraints.coordinator_leverage;
  const double short_leverage = position->direction == domain::Direction::Long
                                    ? constraints.coordinator_leverage
                                    : position->leverage;

  const domain::Amount long_margin =
      calculateMargin(position->average_entry_price, position->quantity,
                      long_leverage)
          .value_or(domain::Amount::zero());
  const domain::Amount short_margin =
      calculateMargin(position->average_entry_price, position->quantity,
                      short_leverage)
          .value_or(domain::Amount::zero());

  const std::int64_t trader_pnl =
      calculatePnl(position->average_entry_price, price, position->quantity,
                   position->direction, long_margin, short_margin)
          .value_or(0);

  const std::int64_t max_coordinator_margin =
      constraints.max_counterparty_balance.sats + coordinator_margin.sats -
      trader_pnl;
  const std::int64_t max_trader_margin =
      constraints.max_local_balance.sats + trader_margin.sats + trader_pnl;

  inputs.max_coordinator_margin =
      domain::Amount{std::max<std::int64_t>(0, max_coordinator_margin)};
  inputs.max_trader_margin =
      domain::Amount{std::max<std::int64_t>(0, max_trader_margin)};
  inputs.open_quantity = position->quantity;

  return calculateMaxQuantity(inputs);
}

}  // namespace cfd
}  // namespace tradecalc
