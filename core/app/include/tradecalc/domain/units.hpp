#pragma once

#include <cmath>
#include <cstdint>

namespace tradecalc {
namespace domain {

// -----------------------------------------------------------------------------
// Amount: an amount of bitcoin in satoshis
// -----------------------------------------------------------------------------
//
// @brief  Margins, fees and channel balances are denominated in sats.
//
// @details
// Inverse (BTC-margined) contracts quote quantity in USD and collateral in
// BTC. Every BTC value that leaves the calculator is rounded to whole sats
// so that the two counterparties agree on the exact collateral.
//
// Value type. Signed so that intermediate PnL arithmetic can go negative;
// margins and fees themselves are never negative.
// -----------------------------------------------------------------------------
struct Amount {
  static constexpr std::int64_t kSatsPerBtc = 100'000'000;

  std::int64_t sats{0};

  static Amount zero() { return Amount{0}; }

  // Rounds half away from zero to the nearest sat.
  static Amount fromBtc(double btc) {
    return Amount{static_cast<std::int64_t>(
        std::llround(btc * static_cast<double>(kSatsPerBtc)))};
  }

  double btc() const {
    return static_cast<double>(sats) / static_cast<double>(kSatsPerBtc);
  }

  friend bool operator==(Amount lhs, Amount rhs) { return lhs.sats == rhs.sats; }
  friend bool operator!=(Amount lhs, Amount rhs) { return lhs.sats != rhs.sats; }
  friend bool operator<(Amount lhs, Amount rhs) { return lhs.sats < rhs.sats; }
  friend bool operator<=(Amount lhs, Amount rhs) { return lhs.sats <= rhs.sats; }
  friend bool operator>(Amount lhs, Amount rhs) { return lhs.sats > rhs.sats; }
  friend bool operator>=(Amount lhs, Amount rhs) { return lhs.sats >= rhs.sats; }

  friend Amount operator+(Amount lhs, Amount rhs) {
    return Amount{lhs.sats + rhs.sats};
  }
  friend Amount operator-(Amount lhs, Amount rhs) {
    return Amount{lhs.sats - rhs.sats};
  }
};

// Subtraction that floors at zero, for balances that cannot go negative.
inline Amount saturatingSub(Amount lhs, Amount rhs) {
  return lhs.sats > rhs.sats ? Amount{lhs.sats - rhs.sats} : Amount::zero();
}

// -----------------------------------------------------------------------------
// Contract quantity (USD)
// -----------------------------------------------------------------------------
// Quantities are plain doubles in USD. User-facing quantities carry at most
// two decimal places.
// -----------------------------------------------------------------------------
inline double roundUsd(double usd) { return std::round(usd * 100.0) / 100.0; }

// Highest BTCUSD price the oracle can attest to (2^20 - 1). Liquidation
// prices that would exceed it, or that are unbounded, are capped here.
constexpr double kBtcUsdMaxPrice = 1'048'575.0;

}  // namespace domain
}  // namespace tradecalc
