#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/price.hpp"
#include "tradecalc/domain/trade_values_snapshot.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <cstdint>

namespace tradecalc {

// -----------------------------------------------------------------------------
// PriceUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: One tick of the orderbook price feed. Produced by the
// PriceFeedGateway (or pushed in-process) and applied by the notifier to
// both sides.
// -----------------------------------------------------------------------------
struct PriceUpdateEvent {
  domain::Price price;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// User input events
// -----------------------------------------------------------------------------
// Edits made on the order-entry form for one direction. They travel through
// the same queue as price ticks, so an edit and a tick are never applied
// concurrently.
// -----------------------------------------------------------------------------
struct QuantityInputEvent {
  domain::Direction direction{domain::Direction::Long};
  double quantity{0.0};
};

struct ContractsInputEvent {
  domain::Direction direction{domain::Direction::Long};
  double contracts{0.0};
};

struct MarginInputEvent {
  domain::Direction direction{domain::Direction::Long};
  domain::Amount margin{0};
};

struct LeverageInputEvent {
  domain::Direction direction{domain::Direction::Long};
  double leverage{1.0};
};

// Channel balances or the open position changed; max quantities are stale.
struct ChannelStateChangedEvent {};

// -----------------------------------------------------------------------------
// TradeValuesChangedEvent
// -----------------------------------------------------------------------------
// Responsibility: The single notification TradeValuesChangeNotifier
// publishes per externally visible change. Carries snapshots of both sides,
// so observers can re-render without calling back into the notifier.
// -----------------------------------------------------------------------------
struct TradeValuesChangedEvent {
  enum class Cause {
    Price,
    Quantity,
    Contracts,
    Margin,
    Leverage,
    MaxQuantity,
  };

  Cause cause{Cause::Price};
  domain::TradeValuesSnapshot long_values;
  domain::TradeValuesSnapshot short_values;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradecalc
