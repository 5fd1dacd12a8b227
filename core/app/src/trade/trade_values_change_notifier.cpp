#include "tradecalc/trade/trade_values_change_notifier.hpp"

#include <chrono>

namespace tradecalc {

using Cause = TradeValuesChangedEvent::Cause;

TradeValuesChangeNotifier::TradeValuesChangeNotifier(
    const ITradeValuesService& service,
    const IChannelInfoProvider& channel_info, EventBus& bus,
    double default_leverage)
    : service_(service),
      channel_info_(channel_info),
      bus_(bus),
      long_values_(initValues(domain::Direction::Long, default_leverage)),
      short_values_(initValues(domain::Direction::Short, default_leverage)) {}

TradeValues TradeValuesChangeNotifier::initValues(
    domain::Direction direction, double default_leverage) const {
  return TradeValues::fromMargin(channel_info_.minTradeMargin(),
                                 default_leverage, std::nullopt, direction,
                                 service_);
}

TradeValues& TradeValuesChangeNotifier::sideFor(domain::Direction direction) {
  return direction == domain::Direction::Long ? long_values_ : short_values_;
}

const TradeValues& TradeValuesChangeNotifier::sideFor(
    domain::Direction direction) const {
  return direction == domain::Direction::Long ? long_values_ : short_values_;
}

const TradeValues& TradeValuesChangeNotifier::fromDirection(
    domain::Direction direction) const {
  return sideFor(direction);
}

domain::TradeValuesSnapshot TradeValuesChangeNotifier::snapshot(
    domain::Direction direction) const {
  std::lock_guard lock(mutex_);
  return sideFor(direction).snapshot();
}

// -----------------------------------------------------------------------------
// updatePrice: ask → long, bid → short, one event at most
// -----------------------------------------------------------------------------
void TradeValuesChangeNotifier::updatePrice(const domain::Price& price) {
  std::optional<TradeValuesChangedEvent> event;

  {
    std::lock_guard lock(mutex_);
    bool changed = false;

    if (price.ask != long_values_.price()) {
      long_values_.updatePrice(price.ask);
      changed = true;
    }
    if (price.bid != short_values_.price()) {
      short_values_.updatePrice(price.bid);
      changed = true;
    }

    if (changed) {
      event = makeEvent(Cause::Price);
    }
  }

  if (event) {
    bus_.publish(*event);
  }
}

void TradeValuesChangeNotifier::updateQuantity(domain::Direction direction,
                                               double quantity) {
  TradeValuesChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    sideFor(direction).updateQuantity(quantity);
    event = makeEvent(Cause::Quantity);
  }
  bus_.publish(event);
}

void TradeValuesChangeNotifier::updateContracts(domain::Direction direction,
                                                double contracts) {
  TradeValuesChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    sideFor(direction).updateContracts(contracts);
    event = makeEvent(Cause::Contracts);
  }
  bus_.publish(event);
}

void TradeValuesChangeNotifier::updateMargin(domain::Direction direction,
                                             domain::Amount margin) {
  TradeValuesChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    sideFor(direction).updateMargin(margin);
    event = makeEvent(Cause::Margin);
  }
  bus_.publish(event);
}

void TradeValuesChangeNotifier::updateLeverage(domain::Direction direction,
                                               double leverage) {
  TradeValuesChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    sideFor(direction).updateLeverage(leverage);
    event = makeEvent(Cause::Leverage);
  }
  bus_.publish(event);
}

void TradeValuesChangeNotifier::recalculateMaxQuantity() {
  TradeValuesChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    long_values_.recalculateMaxQuantity();
    short_values_.recalculateMaxQuantity();
    event = makeEvent(Cause::MaxQuantity);
  }
  bus_.publish(event);
}

void TradeValuesChangeNotifier::setOpenQuantity(domain::Direction direction,
                                                double open_quantity) {
  std::lock_guard lock(mutex_);
  sideFor(direction).setOpenQuantity(open_quantity);
}

std::optional<domain::Amount> TradeValuesChangeNotifier::orderMatchingFee(
    domain::Direction direction) const {
  std::lock_guard lock(mutex_);
  return sideFor(direction).fee();
}

std::optional<domain::Amount> TradeValuesChangeNotifier::counterpartyMargin(
    domain::Direction /*direction*/, double leverage,
    std::optional<double> price, double quantity) const {
  return service_.calculateMargin(price, quantity, leverage);
}

std::optional<domain::Amount> TradeValuesChangeNotifier::counterpartyMargin(
    domain::Direction direction, double leverage) const {
  std::lock_guard lock(mutex_);
  return sideFor(direction).calculateMargin(leverage);
}

TradeValuesChangedEvent TradeValuesChangeNotifier::makeEvent(Cause cause) {
  TradeValuesChangedEvent event;
  event.cause = cause;
  event.long_values = long_values_.snapshot();
  event.short_values = short_values_.snapshot();
  event.timestamp = std::chrono::system_clock::now();
  event.sequence_id = next_sequence_id_++;
  return event;
}

}  // namespace tradecalc
