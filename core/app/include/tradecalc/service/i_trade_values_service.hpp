#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <optional>

namespace tradecalc {

// -----------------------------------------------------------------------------
// ITradeValuesService: calculation oracle used by TradeValues
// -----------------------------------------------------------------------------
//
// @brief  Stateless calculations mapping (price, quantity, leverage,
//         direction) to margin, quantity, liquidation price, fee and max
//         quantity.
//
// @details
// TradeValues only depends on this contract, never on the formulas behind
// it. Every implementation must honour the following:
//
//   calculateMargin            std::nullopt iff price is std::nullopt.
//   calculateQuantity          inverse of calculateMargin; std::nullopt if
//                              price or margin is std::nullopt.
//   calculateLiquidationPrice  std::nullopt iff price is std::nullopt.
//                              long < price < short, and both move towards
//                              price as leverage increases.
//   orderMatchingFee           std::nullopt if price or quantity is
//                              std::nullopt; non-negative and non-decreasing
//                              in quantity.
//   calculateMaxQuantity       std::nullopt iff price is std::nullopt.
//   getExpiryTimestamp         expiry of a trade opened now.
//
// A price that is not positive counts as unknown.
//
// Thread-safety: implementations must be callable from any thread.
// -----------------------------------------------------------------------------
class ITradeValuesService {
 public:
  virtual ~ITradeValuesService() = default;

  virtual std::optional<domain::Amount> calculateMargin(
      std::optional<double> price, double quantity, double leverage) const = 0;

  virtual std::optional<double> calculateQuantity(
      std::optional<double> price, std::optional<domain::Amount> margin,
      double leverage) const = 0;

  virtual std::optional<double> calculateLiquidationPrice(
      std::optional<double> price, double leverage,
      domain::Direction direction) const = 0;

  virtual std::optional<domain::Amount> orderMatchingFee(
      std::optional<double> quantity, std::optional<double> price) const = 0;

  virtual std::optional<double> calculateMaxQuantity(
      std::optional<double> price, double leverage,
      domain::Direction direction) const = 0;

  virtual Timestamp getExpiryTimestamp() const = 0;
};

}  // namespace tradecalc
