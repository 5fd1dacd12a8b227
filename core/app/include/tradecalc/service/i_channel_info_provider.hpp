#pragma once

#include "tradecalc/domain/channel_trade_constraints.hpp"

#include <optional>

namespace tradecalc {

// -----------------------------------------------------------------------------
// IChannelInfoProvider: read access to channel and position state
// -----------------------------------------------------------------------------
//
// @brief  Boundary to the wallet/channel layer, which lives outside this
//         library.
//
// @details
// TradeValuesService asks for the current constraints every time it computes
// a max quantity, so implementations return fresh copies rather than
// references into mutable state.
//
// Thread-safety: implementations must be callable from any thread.
// -----------------------------------------------------------------------------
class IChannelInfoProvider {
 public:
  virtual ~IChannelInfoProvider() = default;

  virtual domain::ChannelTradeConstraints channelTradeConstraints() const = 0;

  virtual std::optional<domain::OpenPosition> openPosition() const = 0;

  // Smallest margin an order may be placed with. Both order-entry sides
  // start out with this margin.
  virtual domain::Amount minTradeMargin() const = 0;
};

}  // namespace tradecalc
