#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"

#include <cstdint>
#include <optional>

namespace tradecalc {
namespace cfd {

// -----------------------------------------------------------------------------
// Inverse BTCUSD contract math
// -----------------------------------------------------------------------------
//
// @brief  Pure functions for BTC-margined contracts whose quantity is quoted
//         in USD.
//
// @details
// A position of Q USD opened at price P with leverage L is backed by
//   margin = Q / (P * L)  BTC
// Both counterparties of a trade use the same formula with their own
// leverage, so the coordinator's collateral for a trade is
// calculateMargin(P, Q, coordinator_leverage).
//
// Every function returns std::nullopt (or a zero amount where documented)
// instead of dividing by a non-positive price or leverage. None of them
// throws.
// -----------------------------------------------------------------------------

/// Collateral in sats for `quantity` USD at `price` and `leverage`.
/// std::nullopt if price or leverage is not positive, or quantity is negative.
std::optional<domain::Amount> calculateMargin(double price, double quantity,
                                              double leverage);

/// Inverse of calculateMargin: the USD quantity `margin` buys at `price` and
/// `leverage`. Not rounded.
std::optional<double> calculateQuantity(double price, domain::Amount margin,
                                        double leverage);

/// price * L / (L + 1 - mmr * L). Always below `price` while mmr * L < 1.
double calculateLongLiquidationPrice(double leverage, double price,
                                     double maintenance_margin_rate);

/// price * L / (L - 1 + mmr * L), capped at kBtcUsdMaxPrice. Unbounded at
/// L = 1 without maintenance margin, in which case the cap is returned.
double calculateShortLiquidationPrice(double leverage, double price,
                                      double maintenance_margin_rate);

/// Liquidation price for `direction`. Nullopt for a non-positive price or
/// leverage, and for a short entered at or above kBtcUsdMaxPrice.
std::optional<double> calculateLiquidationPrice(double price, double leverage,
                                                domain::Direction direction,
                                                double maintenance_margin_rate);

/// Taker fee for matching `quantity` USD at `price`:
///   quantity / price * fee_rate  BTC
/// Non-negative and non-decreasing in quantity.
std::optional<domain::Amount> orderMatchingFee(double quantity, double price,
                                               double fee_rate);

/// Profit (positive) or loss (negative) in sats of a `direction` position of
/// `quantity` USD opened at `opening_price` and closed at `closing_price`.
/// The result is bounded by the margins: a side can never lose more than it
/// put up, nor win more than the counterparty put up.
std::optional<std::int64_t> calculatePnl(double opening_price,
                                         double closing_price, double quantity,
                                         domain::Direction direction,
                                         domain::Amount long_margin,
                                         domain::Amount short_margin);

}  // namespace cfd
}  // namespace tradecalc
