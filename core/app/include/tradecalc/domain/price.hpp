#pragma once

#include "tradecalc/domain/direction.hpp"

#include <optional>

namespace tradecalc {
namespace domain {

// -----------------------------------------------------------------------------
// Price: best bid/ask from the orderbook price feed
// -----------------------------------------------------------------------------
//
// @brief  A tick of the inbound price feed. Either side may be missing, e.g.
//         when the orderbook has no resting orders on that side.
//
// @details
// A long trade fills against the ask, a short trade against the bid.
// -----------------------------------------------------------------------------
struct Price {
  std::optional<double> ask;
  std::optional<double> bid;

  std::optional<double> forDirection(Direction direction) const {
    return direction == Direction::Long ? ask : bid;
  }
};

}  // namespace domain
}  // namespace tradecalc
