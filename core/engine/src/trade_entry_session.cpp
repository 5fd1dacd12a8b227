#include "tradecalc/engine/trade_entry_session.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace tradecalc {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradeEntrySession::TradeEntrySession(domain::TradingConfig config,
                                     const IChannelInfoProvider& channel_info,
                                     const ITimeProvider& clock,
                                     SimulationTimeProvider* feed_clock)
    : config_(std::move(config)),
      channel_info_(channel_info),
      feed_clock_(feed_clock),
      service_(config_, channel_info_, clock) {
  notifier_ = std::make_unique<TradeValuesChangeNotifier>(
      service_, channel_info_, loop_.eventBus(), config_.default_leverage);
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradeEntrySession::~TradeEntrySession() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradeEntrySession::start() {
  if (running_) {
    return;
  }

  // ---  1) Handlers first, so nothing queued is published unobserved ------
  subscribeHandlers();

  // ---  2) Loop thread ------------------------------------------------------
  loop_.start();

  // ---  3) Price feed LAST --------------------------------------------------
  if (!config_.price_feed_endpoint.empty()) {
    auto feed = std::make_unique<PriceFeedThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        config_.price_feed_endpoint, feed_clock_);
    try {
      feed->start();
    } catch (...) {
      loop_.stop();
      unsubscribeHandlers();
      throw;
    }
    feed_thread_ = std::move(feed);
  }

  running_ = true;

  std::cout << "[TradeEntrySession] started. Threads: session_loop"
            << (feed_thread_ ? ", price_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradeEntrySession::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop price inflow first -----------------------------------------
  feed_thread_.reset();

  // ---  2) Join the loop ---------------------------------------------------
  loop_.stop();

  // ---  3) Drop the notifier's subscriptions --------------------------------
  unsubscribeHandlers();

  running_ = false;

  std::cout << "[TradeEntrySession] stopped after " << loop_.processedCount()
            << " events. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Handlers (run on the loop thread)
// -----------------------------------------------------------------------------
void TradeEntrySession::subscribeHandlers() {
  EventBus& bus = loop_.eventBus();
  TradeValuesChangeNotifier& notifier = *notifier_;

  subscriptions_.push_back(bus.subscribe<PriceUpdateEvent>(
      [&notifier](const PriceUpdateEvent& e) { notifier.updatePrice(e.price); }));

  subscriptions_.push_back(bus.subscribe<QuantityInputEvent>(
      [&notifier](const QuantityInputEvent& e) {
        notifier.updateQuantity(e.direction, e.quantity);
      }));

  subscriptions_.push_back(bus.subscribe<ContractsInputEvent>(
      [&notifier](const ContractsInputEvent& e) {
        notifier.updateContracts(e.direction, e.contracts);
      }));

  subscriptions_.push_back(bus.subscribe<MarginInputEvent>(
      [&notifier](const MarginInputEvent& e) {
        notifier.updateMargin(e.direction, e.margin);
      }));

  subscriptions_.push_back(bus.subscribe<LeverageInputEvent>(
      [&notifier](const LeverageInputEvent& e) {
        notifier.updateLeverage(e.direction, e.leverage);
      }));

  subscriptions_.push_back(bus.subscribe<ChannelStateChangedEvent>(
      [&notifier](const ChannelStateChangedEvent&) {
        notifier.recalculateMaxQuantity();
      }));
}

void TradeEntrySession::unsubscribeHandlers() {
  for (EventBus::SubscriptionId id : subscriptions_) {
    loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();
}

// -----------------------------------------------------------------------------
// Inputs
// -----------------------------------------------------------------------------
void TradeEntrySession::pushPrice(domain::Price price) {
  PriceUpdateEvent tick;
  tick.price = price;
  tick.timestamp = std::chrono::system_clock::now();
  tick.sequence_id = next_price_sequence_.fetch_add(1);
  loop_.push(tick);
}

void TradeEntrySession::pushQuantity(domain::Direction direction,
                                     double quantity) {
  loop_.push(QuantityInputEvent{direction, quantity});
}

void TradeEntrySession::pushContracts(domain::Direction direction,
                                      double contracts) {
  loop_.push(ContractsInputEvent{direction, contracts});
}

void TradeEntrySession::pushMargin(domain::Direction direction,
                                   domain::Amount margin) {
  loop_.push(MarginInputEvent{direction, margin});
}

void TradeEntrySession::pushLeverage(domain::Direction direction,
                                     double leverage) {
  loop_.push(LeverageInputEvent{direction, leverage});
}

void TradeEntrySession::pushChannelStateChanged() {
  loop_.push(ChannelStateChangedEvent{});
}

void TradeEntrySession::pushEvent(Event event) {
  loop_.push(std::move(event));
}

domain::TradeValuesSnapshot TradeEntrySession::snapshot(
    domain::Direction direction) const {
  return notifier_->snapshot(direction);
}

}  // namespace tradecalc
