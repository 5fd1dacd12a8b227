#pragma once

#include "tradecalc/domain/trading_config.hpp"
#include "tradecalc/service/i_channel_info_provider.hpp"
#include "tradecalc/service/i_trade_values_service.hpp"
#include "tradecalc/time/i_time_provider.hpp"

namespace tradecalc {

// -----------------------------------------------------------------------------
// TradeValuesService: ITradeValuesService for inverse BTCUSD contracts
// -----------------------------------------------------------------------------
//
// @brief  Maps the optional-price contract of ITradeValuesService onto the
//         pure cfd:: formulas.
//
// @details
// Rates (maintenance margin, order matching fee) and the network come from
// TradingConfig. Max quantity additionally reads the live channel
// constraints and open position from the IChannelInfoProvider, and expiry
// reads "now" from the ITimeProvider.
//
// Quantities returned by calculateQuantity are rounded to cents.
//
// Ownership:
//   Borrows the provider and the clock; both must outlive the service.
// -----------------------------------------------------------------------------
class TradeValuesService final : public ITradeValuesService {
 public:
  TradeValuesService(const domain::TradingConfig& config,
                     const IChannelInfoProvider& channel_info,
                     const ITimeProvider& time_provider);

  std::optional<domain::Amount> calculateMargin(std::optional<double> price,
                                                double quantity,
                                                double leverage) const override;

  std::optional<double> calculateQuantity(std::optional<double> price,
                                          std::optional<domain::Amount> margin,
                                          double leverage) const override;

  std::optional<double> calculateLiquidationPrice(
      std::optional<double> price, double leverage,
      domain::Direction direction) const override;

  std::optional<domain::Amount> orderMatchingFee(
      std::optional<double> quantity,
      std::optional<double> price) const override;

  std::optional<double> calculateMaxQuantity(
      std::optional<double> price, double leverage,
      domain::Direction direction) const override;

  Timestamp getExpiryTimestamp() const override;

 private:
  double maintenance_margin_rate_;
  double order_matching_fee_rate_;
  domain::Network network_;

  const IChannelInfoProvider& channel_info_;
  const ITimeProvider& time_provider_;
};

}  // namespace tradecalc
