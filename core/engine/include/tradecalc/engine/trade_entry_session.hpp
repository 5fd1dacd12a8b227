#pragma once

#include "tradecalc/concurrent/event_loop_thread.hpp"
#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/price.hpp"
#include "tradecalc/domain/trade_values_snapshot.hpp"
#include "tradecalc/domain/trading_config.hpp"
#include "tradecalc/domain/units.hpp"
#include "tradecalc/gateway/price_feed_thread.hpp"
#include "tradecalc/service/i_channel_info_provider.hpp"
#include "tradecalc/service/trade_values_service.hpp"
#include "tradecalc/time/i_time_provider.hpp"
#include "tradecalc/time/simulation_time_provider.hpp"
#include "tradecalc/trade/trade_values_change_notifier.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace tradecalc {

// -----------------------------------------------------------------------------
// TradeEntrySession
// -----------------------------------------------------------------------------
//
// @brief  Composition root for one order-entry screen: owns the trade-values
//         service, the notifier with its long and short sides, the loop
//         thread that serializes every change, and the optional price feed.
//
// @details
// Provides a start/stop lifecycle so that main() and tests can drive the
// engine without wiring its internals.
//
// Thread layout:
//
//   session loop thread  → TradeValuesChangeNotifier (all recomputation)
//   price feed thread    → PriceFeedGateway ZMQ recv loop (optional)
//   caller threads       → push*() and snapshot()
//
// Data flow:
//   push*() / feed tick ─► loop queue ─► loop bus ─► notifier
//                                                        │
//   observers ◄── TradeValuesChangedEvent on loop bus ◄──┘
//
// Because ticks and user edits share one queue, they are applied one at a
// time in arrival order and never interleave inside a recomputation.
//
// Thread model:
//   Constructed, started, stopped and destroyed on one thread. push*() may
//   be called from any thread. Subscribers to eventBus() run on the loop
//   thread. snapshot() may be called from any thread; it reads through the
//   notifier's mutex.
//
// Ownership:
//   TradeEntrySession
//    ├── config_          (TradingConfig, value member)
//    ├── channel_info_    (const IChannelInfoProvider&, non-owning)
//    ├── service_         (TradeValuesService, value member)
//    ├── loop_            (EventLoopThread, value member)
//    ├── notifier_        (unique_ptr<TradeValuesChangeNotifier>)
//    └── feed_thread_     (unique_ptr<PriceFeedThread>, only while started)
//
// The notifier is created in the constructor so the initial state can be
// inspected before start(). It survives stop(); a restarted session keeps
// the values it had.
// -----------------------------------------------------------------------------
class TradeEntrySession {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config        Trading parameters. An empty price_feed_endpoint
  //                       disables the feed thread (tests push prices via
  //                       pushPrice()).
  // @param  channel_info  Channel constraints and open position. Must
  //                       outlive the session.
  // @param  clock         Source of "now" for expiry timestamps. Must
  //                       outlive the session.
  // @param  feed_clock    Optional simulation clock the feed advances to
  //                       each tick's timestamp. Usually the same object as
  //                       `clock` when replaying a recorded feed.
  //
  // Side-effects: None. No threads, no sockets.
  // -------------------------------------------------------------------------
  TradeEntrySession(domain::TradingConfig config,
                    const IChannelInfoProvider& channel_info,
                    const ITimeProvider& clock,
                    SimulationTimeProvider* feed_clock = nullptr);

  ~TradeEntrySession();

  TradeEntrySession(const TradeEntrySession&) = delete;
  TradeEntrySession& operator=(const TradeEntrySession&) = delete;
  TradeEntrySession(TradeEntrySession&&) = delete;
  TradeEntrySession& operator=(TradeEntrySession&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // Startup sequence:
  //   1. Subscribe the notifier's handlers on the loop bus.
  //   2. Start the loop thread.
  //   3. Start the price feed LAST, so every handler is live before the
  //      first tick is queued.
  //
  // Idempotent. Throws zmq::error_t if the feed endpoint is malformed; the
  // session is left stopped in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // Shutdown sequence:
  //   1. Stop the price feed (no new ticks).
  //   2. Stop the loop thread. Events still queued are dropped.
  //   3. Remove the notifier's subscriptions.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // Inputs. All thread-safe; each is applied on the loop thread.
  // -------------------------------------------------------------------------
  void pushPrice(domain::Price price);
  void pushQuantity(domain::Direction direction, double quantity);
  void pushContracts(domain::Direction direction, double contracts);
  void pushMargin(domain::Direction direction, domain::Amount margin);
  void pushLeverage(domain::Direction direction, double leverage);

  // Call after the channel balances or the open position changed.
  void pushChannelStateChanged();

  // Event sink bound to the feed. Also usable for arbitrary injection.
  void pushEvent(Event event);

  // Observers subscribe here for TradeValuesChangedEvent.
  EventBus& eventBus() { return loop_.eventBus(); }

  domain::TradeValuesSnapshot snapshot(domain::Direction direction) const;

  const TradeValuesChangeNotifier& notifier() const { return *notifier_; }
  const ITradeValuesService& service() const { return service_; }
  const domain::TradingConfig& config() const { return config_; }

 private:
  void subscribeHandlers();
  void unsubscribeHandlers();

  domain::TradingConfig config_;
  const IChannelInfoProvider& channel_info_;
  SimulationTimeProvider* feed_clock_;

  TradeValuesService service_;

  // Destroyed after the notifier (reverse member order).
  EventLoopThread loop_;

  std::unique_ptr<TradeValuesChangeNotifier> notifier_;
  std::unique_ptr<PriceFeedThread> feed_thread_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
  std::atomic<std::uint64_t> next_price_sequence_{1};
  bool running_{false};
};

}  // namespace tradecalc
