#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <optional>

namespace tradecalc {
namespace domain {

// Which of quantity and margin the user is editing. The other one is
// derived from it whenever the price changes.
enum class PrimaryField {
  Quantity,
  Margin,
};

// -----------------------------------------------------------------------------
// TradeValuesSnapshot: immutable copy of one order-entry side
// -----------------------------------------------------------------------------
//
// @brief  Every field of a TradeValues at one instant, with value semantics.
//
// @details
// Carried by TradeValuesChangedEvent so observers never hold references into
// the notifier's mutable state. Optional fields are std::nullopt while the
// price for this direction is unknown.
// -----------------------------------------------------------------------------
struct TradeValuesSnapshot {
  Direction direction{Direction::Long};
  PrimaryField primary_field{PrimaryField::Quantity};

  double quantity{0.0};       // Netted quantity that needs new margin (USD)
  double contracts{0.0};      // Quantity entered for the fill (USD)
  double open_quantity{0.0};  // Opposite open position being reduced (USD)
  double leverage{1.0};

  std::optional<double> price;
  std::optional<Amount> margin;
  std::optional<double> liquidation_price;
  std::optional<Amount> fee;
  std::optional<double> max_quantity;

  Timestamp expiry{};
};

}  // namespace domain
}  // namespace tradecalc
