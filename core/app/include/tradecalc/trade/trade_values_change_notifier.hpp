#pragma once

#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/price.hpp"
#include "tradecalc/domain/trade_values_snapshot.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/eventbus/event_bus.hpp"
#include "tradecalc/events/event_types.hpp"
#include "tradecalc/service/i_channel_info_provider.hpp"
#include "tradecalc/service/i_trade_values_service.hpp"
#include "tradecalc/trade/trade_values.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace tradecalc {

// -----------------------------------------------------------------------------
// TradeValuesChangeNotifier: owner of the long and short order-entry sides
// -----------------------------------------------------------------------------
//
// @brief  Applies price ticks and user edits to the TradeValues of the
//         matching direction and publishes one TradeValuesChangedEvent per
//         visible change.
//
// @details
// Both sides start Margin-primary with the channel's minimum trade margin,
// the configured default leverage and no price.
//
// Notification rules:
//   - updatePrice: the ask is applied to the long side and the bid to the
//     short side, each only if it differs from that side's current price.
//     One event if either or both sides changed, none otherwise.
//   - updateQuantity / updateContracts / updateMargin / updateLeverage /
//     recalculateMaxQuantity: exactly one event per call.
//
// Thread model:
//   Every mutator takes mutex_ for the whole recomputation, so a reader
//   calling snapshot() from another thread never sees a half-updated side.
//   Events are published after the lock is released. In a
//   TradeEntrySession all mutators run on the session's loop thread.
//
// Ownership:
//   Owns both TradeValues. Borrows the service, the channel info provider
//   and the EventBus; all three must outlive the notifier.
// -----------------------------------------------------------------------------
class TradeValuesChangeNotifier {
 public:
  TradeValuesChangeNotifier(const ITradeValuesService& service,
                            const IChannelInfoProvider& channel_info,
                            EventBus& bus, double default_leverage = 2.0);

  TradeValuesChangeNotifier(const TradeValuesChangeNotifier&) = delete;
  TradeValuesChangeNotifier& operator=(const TradeValuesChangeNotifier&) =
      delete;

  // Direct access to one side. Only safe on the thread that drives the
  // mutators; use snapshot() elsewhere.
  const TradeValues& fromDirection(domain::Direction direction) const;

  domain::TradeValuesSnapshot snapshot(domain::Direction direction) const;

  void updatePrice(const domain::Price& price);

  void updateQuantity(domain::Direction direction, double quantity);
  void updateContracts(domain::Direction direction, double contracts);
  void updateMargin(domain::Direction direction, domain::Amount margin);
  void updateLeverage(domain::Direction direction, double leverage);

  // Re-reads the channel constraints for both sides. One event.
  void recalculateMaxQuantity();

  // Sets the opposite open quantity of one side; applied by the next
  // updateContracts() on that side. No event.
  void setOpenQuantity(domain::Direction direction, double open_quantity);

  std::optional<domain::Amount> orderMatchingFee(
      domain::Direction direction) const;

  // Margin the counterparty of a `direction` trade would have to lock up at
  // `leverage`, for the given price and quantity. Pure; `direction` names
  // the side being previewed and does not enter the formula.
  std::optional<domain::Amount> counterpartyMargin(
      domain::Direction direction, double leverage,
      std::optional<double> price, double quantity) const;

  // Same, using the current price and quantity of the `direction` side.
  std::optional<domain::Amount> counterpartyMargin(domain::Direction direction,
                                                   double leverage) const;

 private:
  TradeValues initValues(domain::Direction direction,
                         double default_leverage) const;

  TradeValues& sideFor(domain::Direction direction);
  const TradeValues& sideFor(domain::Direction direction) const;

  // Builds the event from the current state. Caller holds mutex_.
  TradeValuesChangedEvent makeEvent(TradeValuesChangedEvent::Cause cause);

  const ITradeValuesService& service_;
  const IChannelInfoProvider& channel_info_;
  EventBus& bus_;

  mutable std::mutex mutex_;
  TradeValues long_values_;
  TradeValues short_values_;
  std::uint64_t next_sequence_id_{1};
};

}  // namespace tradecalc
