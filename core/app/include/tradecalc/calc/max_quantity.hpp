#pragma once

#include "tradecalc/domain/channel_trade_constraints.hpp"
#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"

#include <optional>

namespace tradecalc {
namespace cfd {

// -----------------------------------------------------------------------------
// MaxQuantityInputs: already-reduced margins for calculateMaxQuantity
// -----------------------------------------------------------------------------
struct MaxQuantityInputs {
  double price{0.0};
  domain::Amount max_coordinator_margin{0};
  domain::Amount max_trader_margin{0};
  std::optional<domain::Amount> on_chain_fee_estimate;
  double coordinator_leverage{2.0};
  double trader_leverage{2.0};
  double order_matching_fee_rate{0.0};
  domain::Amount accumulated_order_matching_fees{0};
  double open_quantity{0.0};
};

// -----------------------------------------------------------------------------
// calculateMaxQuantity
// -----------------------------------------------------------------------------
//
// @brief  Largest whole-USD quantity both counterparties can collateralize.
//
// @details
//   1. Hold back the on-chain fee estimate (if a channel must be opened)
//      from both margins, and the accumulated matching fees from the
//      coordinator's margin.
//   2. Convert each margin to a quantity at its own leverage and keep the
//      side that allows the smaller quantity.
//   3. Charge the matching fee for that quantity plus the open quantity
//      against the kept margin.
//   4. Convert the reduced margin back to a quantity, add the open quantity
//      and round down.
//
// This is a close approximation, not an exact maximum: the fee in step 3 is
// computed on a quantity that is slightly too large.
//
// @return 0 if the price is not positive.
// -----------------------------------------------------------------------------
double calculateMaxQuantity(const MaxQuantityInputs& inputs);

// -----------------------------------------------------------------------------
// maxQuantity
// -----------------------------------------------------------------------------
//
// @brief  Derives MaxQuantityInputs from the channel state and the open
//         position and returns calculateMaxQuantity() of them.
//
// @details
// Trading against an open position first frees that position's margins. The
// trader gets their collateral back plus the position's unrealized PnL at
// `price`; the coordinator gets its collateral back minus that PnL. The
// coordinator's collateral is whatever is locked in the channel beyond both
// balances and the trader's collateral.
//
// The counterparty of the open position is assumed to trade at the
// channel's coordinator leverage.
// -----------------------------------------------------------------------------
double maxQuantity(double price, double trader_leverage,
                   domain::Direction trader_direction,
                   const domain::ChannelTradeConstraints& constraints,
                   const std::optional<domain::OpenPosition>& position,
                   double order_matching_fee_rate);

}  // namespace cfd
}  // namespace tradecalc
