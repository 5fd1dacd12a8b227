#include "tradecalc/service/trade_values_service.hpp"
#include "tradecalc/calc/cfd.hpp"
#include "tradecalc/calc/max_quantity.hpp"
#include "tradecalc/time/expiry_schedule.hpp"

namespace tradecalc {

namespace {

std::optional<double> knownPrice(std::optional<double> price) {
  if (!price || *price <= 0.0) {
    return std::nullopt;
  }
  return price;
}

}  // namespace

TradeValuesService::TradeValuesService(const domain::TradingConfig& config,
                                       const IChannelInfoProvider& channel_info,
                                       const ITimeProvider& time_provider)
    : maintenance_margin_rate_(config.maintenance_margin_rate),
      order_matching_fee_rate_(config.order_matching_fee_rate),
      network_(config.network),
      channel_info_(channel_info),
      time_provider_(time_provider) {}

std::optional<domain::Amount> TradeValuesService::calculateMargin(
    std::optional<double> price, double quantity, double leverage) const {
  const auto p = knownPrice(price);
  if (!p) {
    return std::nullopt;
  }
  return cfd::calculateMargin(*p, quantity, leverage);
}

std::optional<double> TradeValuesService::calculateQuantity(
    std::optional<double> price, std::optional<domain::Amount> margin,
    double leverage) const {
  const auto p = knownPrice(price);
  if (!p || !margin) {
    return std::nullopt;
  }
  const auto quantity = cfd::calculateQuantity(*p, *margin, leverage);
  if (!quantity) {
    return std::nullopt;
  }
  return domain::roundUsd(*quantity);
}

std::optional<double> TradeValuesService::calculateLiquidationPrice(
    std::optional<double> price, double leverage,
    domain::Direction direction) const {
  const auto p = knownPrice(price);
  if (!p) {
    return std::nullopt;
  }
  return cfd::calculateLiquidationPrice(*p, leverage, direction,
                                        maintenance_margin_rate_);
}

std::optional<domain::Amount> TradeValuesService::orderMatchingFee(
    std::optional<double> quantity, std::optional<double> price) const {
  const auto p = knownPrice(price);
  if (!p || !quantity) {
    return std::nullopt;
  }
  return cfd::orderMatchingFee(*quantity, *p, order_matching_fee_rate_);
}

std::optional<double> TradeValuesService::calculateMaxQuantity(
    std::optional<double> price, double leverage,
    domain::Direction direction) const {
  const auto p = knownPrice(price);
  if (!p) {
    return std::nullopt;
  }
  return cfd::maxQuantity(*p, leverage, direction,
                          channel_info_.channelTradeConstraints(),
                          channel_info_.openPosition(),
                          order_matching_fee_rate_);
}

Timestamp TradeValuesService::getExpiryTimestamp() const {
  return calculateNextExpiry(ms_to_timestamp(time_provider_.now_ms()),
                             network_);
}

}  // namespace tradecalc
