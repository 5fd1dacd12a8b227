#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/trade_values_snapshot.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/service/i_trade_values_service.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <optional>

namespace tradecalc {

// -----------------------------------------------------------------------------
// TradeValues: one side (long or short) of an order-entry session
// -----------------------------------------------------------------------------
//
// @brief  Holds the user's inputs for one direction and keeps every derived
//         field consistent with them.
//
// @details
// Inputs:   quantity or margin (whichever is the primary field), contracts,
//           open quantity, leverage, and the price pushed by the feed.
// Derived:  margin or quantity (the non-primary one), liquidation price,
//           order-matching fee and the cached max quantity.
//
// Every update* method re-derives each field that depends on what it
// changed before it returns. A derived field is therefore either consistent
// with the current inputs or std::nullopt, and it is std::nullopt exactly
// when the price for this direction is unknown (absent or not positive).
// An unknown price is the normal state before the feed connects; nothing
// here throws because of it.
//
// Netting against an open position:
//   contracts is the quantity the user wants filled. If an opposite-direction
//   position of open_quantity is open, only contracts - open_quantity (never
//   less than 0) needs new margin; that netted amount is `quantity`. The fee
//   is charged on contracts, margin is required on quantity.
//
// Primary field:
//   With PrimaryField::Quantity a price change re-derives the margin; with
//   PrimaryField::Margin it keeps the margin and re-derives the quantity.
//   A margin entered while the price is unknown is kept pending and applied
//   when the first price arrives.
//
// Thread model:
//   Not synchronized. The owner (TradeValuesChangeNotifier) serializes all
//   access.
//
// Ownership:
//   Borrows the ITradeValuesService, which must outlive the instance.
// -----------------------------------------------------------------------------
class TradeValues {
 public:
  // Quantity-primary side priced at `price` (std::nullopt if not yet known).
  static TradeValues fromQuantity(double quantity, double leverage,
                                  std::optional<double> price,
                                  domain::Direction direction,
                                  const ITradeValuesService& service);

  // Margin-primary side. The quantity follows from `margin` once a price is
  // known.
  static TradeValues fromMargin(domain::Amount margin, double leverage,
                                std::optional<double> price,
                                domain::Direction direction,
                                const ITradeValuesService& service);

  // -------------------------------------------------------------------------
  // Mutators
  // -------------------------------------------------------------------------

  // Sets quantity (rounded to cents) and re-derives margin and liquidation
  // price. Discards a pending margin.
  void updateQuantity(double quantity);

  // Sets contracts and the netted quantity, then re-derives margin, fee and
  // liquidation price.
  void updateContracts(double contracts);

  // Sets margin and re-derives quantity, fee, liquidation price and max
  // quantity. Without a price the margin is kept pending and quantity is left
  // as it was.
  void updateMargin(domain::Amount margin);

  // Sets the price and re-derives the non-primary field, liquidation price,
  // fee and max quantity.
  void updatePrice(std::optional<double> price);

  // Sets leverage and re-derives margin, liquidation price and max quantity.
  // Quantity is left unchanged: a leverage change only changes the required
  // collateral. A margin pending on an unknown price is rescaled to the new
  // leverage.
  void updateLeverage(double leverage);

  // Refreshes the cached max quantity, e.g. after the channel balance
  // changed.
  void recalculateMaxQuantity();

  // Takes effect with the next updateContracts().
  void setOpenQuantity(double open_quantity) { open_quantity_ = open_quantity; }

  void setPrimaryField(domain::PrimaryField field) { primary_field_ = field; }

  // -------------------------------------------------------------------------
  // Queries
  // -------------------------------------------------------------------------

  // Margin the current quantity would need at `leverage`, e.g. the
  // counterparty's collateral at their leverage. Does not modify state.
  std::optional<domain::Amount> calculateMargin(double leverage) const;

  domain::Direction direction() const { return direction_; }
  domain::PrimaryField primaryField() const { return primary_field_; }
  double quantity() const { return quantity_; }
  double contracts() const { return contracts_; }
  double openQuantity() const { return open_quantity_; }
  double leverage() const { return leverage_; }
  std::optional<double> price() const { return price_; }
  std::optional<domain::Amount> margin() const { return margin_; }
  std::optional<double> liquidationPrice() const { return liquidation_price_; }
  std::optional<domain::Amount> fee() const { return fee_; }
  std::optional<double> maxQuantity() const { return max_quantity_; }
  Timestamp expiry() const { return expiry_; }

  domain::TradeValuesSnapshot snapshot() const;

 private:
  TradeValues(domain::Direction direction, double leverage,
              domain::PrimaryField primary_field,
              const ITradeValuesService& service);

  bool priceKnown() const { return price_ && *price_ > 0.0; }

  void recalculateMargin();
  void recalculateQuantity();
  void recalculateLiquidationPrice();
  void recalculateFee();

  const ITradeValuesService& service_;

  const domain::Direction direction_;
  domain::PrimaryField primary_field_;

  double quantity_{0.0};
  double contracts_{0.0};
  double open_quantity_{0.0};
  double leverage_;

  std::optional<double> price_;
  std::optional<domain::Amount> margin_;
  std::optional<domain::Amount> pending_margin_;
  std::optional<double> liquidation_price_;
  std::optional<domain::Amount> fee_;
  std::optional<double> max_quantity_;

  Timestamp expiry_{};
};

}  // namespace tradecalc
