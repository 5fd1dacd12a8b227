#include "tradecalc/trade/trade_values.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace tradecalc {

TradeValues::TradeValues(domain::Direction direction, double leverage,
                         domain::PrimaryField primary_field,
                         const ITradeValuesService& service)
    : service_(service),
      direction_(direction),
      primary_field_(primary_field),
      leverage_(leverage),
      expiry_(service.getExpiryTimestamp()) {}

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------
TradeValues TradeValues::fromQuantity(double quantity, double leverage,
                                      std::optional<double> price,
                                      domain::Direction direction,
                                      const ITradeValuesService& service) {
  TradeValues values(direction, leverage, domain::PrimaryField::Quantity,
                     service);
  values.quantity_ = domain::roundUsd(quantity);
  values.contracts_ = values.quantity_;
  values.updatePrice(price);
  return values;
}

TradeValues TradeValues::fromMargin(domain::Amount margin, double leverage,
                                    std::optional<double> price,
                                    domain::Direction direction,
                                    const ITradeValuesService& service) {
  TradeValues values(direction, leverage, domain::PrimaryField::Margin,
                     service);
  values.pending_margin_ = margin;
  values.updatePrice(price);
  return values;
}

// -----------------------------------------------------------------------------
// Mutators
// -----------------------------------------------------------------------------
void TradeValues::updateQuantity(double quantity) {
  quantity_ = domain::roundUsd(quantity);
  pending_margin_.reset();
  recalculateMargin();
  // Crossing zero flips the direction the liquidation price is taken for.
  recalculateLiquidationPrice();
}

void TradeValues::updateContracts(double contracts) {
  contracts_ = domain::roundUsd(contracts);
  quantity_ = domain::roundUsd(std::max(0.0, contracts_ - open_quantity_));
  pending_margin_.reset();
  recalculateMargin();
  recalculateFee();
  recalculateLiquidationPrice();
}

void TradeValues::updateMargin(domain::Amount margin) {
  if (priceKnown()) {
    pending_margin_.reset();
    margin_ = margin;
    recalculateQuantity();
  } else {
    pending_margin_ = margin;
    margin_.reset();
  }
  recalculateFee();
  recalculateLiquidationPrice();
  recalculateMaxQuantity();
}

void TradeValues::updatePrice(std::optional<double> price) {
  price_ = price;

  if (!priceKnown()) {
    if (primary_field_ == domain::PrimaryField::Margin && margin_) {
      pending_margin_ = margin_;
    }
    margin_.reset();
  } else if (primary_field_ == domain::PrimaryField::Margin &&
             (margin_ || pending_margin_)) {
    if (!margin_) {
      margin_ = pending_margin_;
    }
    pending_margin_.reset();
    recalculateQuantity();
  } else {
    recalculateMargin();
  }

  recalculateLiquidationPrice();
  recalculateFee();
  recalculateMaxQuantity();
}

void TradeValues::updateLeverage(double leverage) {
  // A margin held while the price is unknown was sized for the old leverage.
  // Rescale it so the quantity it restores to is the same.
  if (pending_margin_ && leverage_ > 0.0 && leverage > 0.0) {
    pending_margin_ = domain::Amount{static_cast<std::int64_t>(std::llround(
        static_cast<double>(pending_margin_->sats) * leverage_ / leverage))};
  }
  leverage_ = leverage;
  recalculateMargin();
  recalculateLiquidationPrice();
  recalculateMaxQuantity();
}

void TradeValues::recalculateMaxQuantity() {
  max_quantity_ =
      service_.calculateMaxQuantity(price_, leverage_, direction_);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Amount> TradeValues::calculateMargin(
    double leverage) const {
  return service_.calculateMargin(price_, quantity_, leverage);
}

domain::TradeValuesSnapshot TradeValues::snapshot() const {
  domain::TradeValuesSnapshot s;
  s.direction = direction_;
  s.primary_field = primary_field_;
  s.quantity = quantity_;
  s.contracts = contracts_;
  s.open_quantity = open_quantity_;
  s.leverage = leverage_;
  s.price = price_;
  s.margin = margin_;
  s.liquidation_price = liquidation_price_;
  s.fee = fee_;
  s.max_quantity = max_quantity_;
  s.expiry = expiry_;
  return s;
}

// -----------------------------------------------------------------------------
// Derivations
// -----------------------------------------------------------------------------
void TradeValues::recalculateMargin() {
  margin_ = service_.calculateMargin(price_, quantity_, leverage_);
}

void TradeValues::recalculateQuantity() {
  const auto quantity =
      service_.calculateQuantity(price_, margin_, leverage_);
  if (quantity) {
    quantity_ = *quantity;
  }
}

void TradeValues::recalculateLiquidationPrice() {
  // A zero netted quantity means the trade only reduces the opposite open
  // position. Whatever remains of it stays in the opposite direction.
  // TODO: confirm against the coordinator's liquidation rules for partially
  // reduced positions.
  const domain::Direction liquidation_direction =
      quantity_ == 0.0 ? domain::opposite(direction_) : direction_;
  liquidation_price_ = service_.calculateLiquidationPrice(
      price_, leverage_, liquidation_direction);
}

void TradeValues::recalculateFee() {
  fee_ = service_.orderMatchingFee(contracts_, price_);
}

}  // namespace tradecalc
