#include "tradecalc/calc/cfd.hpp"

#include <algorithm>
#include <cmath>

namespace tradecalc {
namespace cfd {

std::optional<domain::Amount> calculateMargin(double price, double quantity,
                                              double leverage) {
  if (price <= 0.0 || leverage <= 0.0 || quantity < 0.0) {
    return std::nullopt;
  }
  return domain::Amount::fromBtc(quantity / (price * leverage));
}

std::optional<double> calculateQuantity(double price, domain::Amount margin,
                                        double leverage) {
  if (price <= 0.0 || leverage <= 0.0 || margin.sats < 0) {
    return std::nullopt;
  }
  return margin.btc() * price * leverage;
}

double calculateLongLiquidationPrice(double leverage, double price,
                                     double maintenance_margin_rate) {
  const double denominator =
      leverage + 1.0 - maintenance_margin_rate * leverage;
  if (denominator <= 0.0) {
    return price;
  }
  return std::max(0.0, price * leverage / denominator);
}

double calculateShortLiquidationPrice(double leverage, double price,
                                      double maintenance_margin_rate) {
  const double denominator =
      leverage - 1.0 + maintenance_margin_rate * leverage;
  if (denominator <= 0.0) {
    return domain::kBtcUsdMaxPrice;
  }
  return std::min(domain::kBtcUsdMaxPrice, price * leverage / denominator);
}

std::optional<double> calculateLiquidationPrice(
    double price, double leverage, domain::Direction direction,
    double maintenance_margin_rate) {
  if (price <= 0.0 || leverage <= 0.0) {
    return std::nullopt;
  }
  // No short liquidation price above the entry is representable.
  if (direction == domain::Direction::Short &&
      price >= domain::kBtcUsdMaxPrice) {
    return std::nullopt;
  }

  switch (direction) {
    case domain::Direction::Long:
      return calculateLongLiquidationPrice(leverage, price,
                                           maintenance_margin_rate);
    case domain::Direction::Short:
      return calculateShortLiquidationPrice(leverage, price,
                                            maintenance_margin_rate);
  }
  return std::nullopt;
}

std::optional<domain::Amount> orderMatchingFee(double quantity, double price,
                                               double fee_rate) {
  if (price <= 0.0) {
    return std::nullopt;
  }
  const double fee_btc =
      std::max(0.0, quantity) * (1.0 / price) * std::max(0.0, fee_rate);
  return domain::Amount::fromBtc(fee_btc);
}

std::optional<std::int64_t> calculatePnl(double opening_price,
                                         double closing_price, double quantity,
                                         domain::Direction direction,
                                         domain::Amount long_margin,
                                         domain::Amount short_margin) {
  if (opening_price <= 0.0 || closing_price <= 0.0) {
    return std::nullopt;
  }

  // PnL of the long side. Inverse contracts pay out in BTC, so the value of
  // Q USD is Q / price and the long gains when the BTC value of the contract
  // shrinks.
  const double uncapped_long_btc =
      quantity * (1.0 / opening_price - 1.0 / closing_price);
  const std::int64_t uncapped_long =
      domain::Amount::fromBtc(uncapped_long_btc).sats;

  switch (direction) {
    case domain::Direction::Long:
      return std::clamp(uncapped_long, -long_margin.sats, short_margin.sats);
    case domain::Direction::Short:
      return std::clamp(-uncapped_long, -short_margin.sats, long_margin.sats);
  }
  return std::nullopt;
}

}  // namespace cfd
}  // namespace tradecalc
