#pragma once

#include <string>

namespace tradecalc {
namespace domain {

// -----------------------------------------------------------------------------
// Direction: side of a trade-entry form
// -----------------------------------------------------------------------------
//
// @brief  Long buys contracts at the ask, Short sells contracts at the bid.
//
// @details
// Each order-entry session owns exactly one TradeValues per Direction. The
// direction of an instance never changes after construction.
// -----------------------------------------------------------------------------
enum class Direction {
  Long,
  Short,
};

inline Direction opposite(Direction direction) {
  return direction == Direction::Long ? Direction::Short : Direction::Long;
}

inline std::string toString(Direction direction) {
  return direction == Direction::Long ? "long" : "short";
}

}  // namespace domain
}  // namespace tradecalc
