#pragma once

#include "tradecalc/domain/channel_trade_constraints.hpp"

#include <string>

namespace tradecalc {
namespace domain {

// Bitcoin network the contracts settle on. Only mainnet uses the weekly
// expiry calendar; every other network expires daily.
enum class Network {
  Bitcoin,
  Testnet,
  Signet,
  Regtest,
};

// -----------------------------------------------------------------------------
// TradingConfig: engine-wide trading parameters
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of parameters shared by the calculator, the
//         trade-values service and the trade-entry session.
//
// @details
// Loaded from JSON by ConfigLoader, or default-constructed for tests. Passed
// by value (or const reference) to component constructors and constant for
// the lifetime of a session.
//
// Constraint:
//   maintenance_margin_rate * max_leverage < 1. Above that, the liquidation
//   price of a long at max leverage would sit at or above the entry price.
// -----------------------------------------------------------------------------
struct TradingConfig {
  Network network{Network::Bitcoin};

  /// Fraction of the position value that must remain as collateral before
  /// the position is liquidated.
  double maintenance_margin_rate{0.05};

  /// Taker fee charged by the orderbook, as a fraction of the notional in BTC.
  double order_matching_fee_rate{0.003};

  /// Leverage both order-entry sides start with.
  double default_leverage{2.0};

  /// Upper bound of the leverage slider.
  double max_leverage{10.0};

  /// ZeroMQ endpoint of the orderbook price publisher. Empty disables the
  /// feed; prices can still be pushed in-process.
  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};

  /// Initial channel state handed to ConfiguredChannelInfoProvider.
  ChannelTradeConstraints channel;
};

}  // namespace domain
}  // namespace tradecalc
