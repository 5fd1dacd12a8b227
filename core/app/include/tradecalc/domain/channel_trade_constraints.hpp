#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"

#include <optional>

namespace tradecalc {
namespace domain {

// -----------------------------------------------------------------------------
// ChannelTradeConstraints: what the current channel (or wallet) can fund
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of the balances and fee estimates that bound the largest
//         trade the user and the coordinator can collateralize.
//
// @details
// If a channel already exists (is_channel_balance), both margins come out of
// the channel balances and no on-chain fees are due. Otherwise the trade
// opens a channel, and the estimated fee reserve plus twice the estimated
// funding transaction fee are held back from both sides.
//
// total_collateral_sats is the sum of everything locked in the channel,
// including both current margins. It is only meaningful while a channel
// exists.
// -----------------------------------------------------------------------------
struct ChannelTradeConstraints {
  Amount max_local_balance{0};
  Amount max_counterparty_balance{0};
  double coordinator_leverage{2.0};
  bool is_channel_balance{false};
  Amount min_margin{1'000};
  Amount estimated_fee_reserve{0};
  Amount estimated_funding_tx_fee{0};
  std::optional<Amount> total_collateral;
};

// -----------------------------------------------------------------------------
// OpenPosition: the user's currently open position, if any
// -----------------------------------------------------------------------------
// Only one position per contract symbol exists at a time. A trade in the
// opposite direction first reduces this position before opening a new one.
// -----------------------------------------------------------------------------
struct OpenPosition {
  Direction direction{Direction::Long};
  double quantity{0.0};                 // USD contracts
  double average_entry_price{0.0};
  double leverage{1.0};
  Amount collateral{0};                 // Trader margin locked in the position
  Amount order_matching_fees{0};        // Fees accumulated by this position
};

}  // namespace domain
}  // namespace tradecalc
