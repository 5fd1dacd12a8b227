// -----------------------------------------------------------------------------
// tradecalc_session: order-entry calculator driven by a live price feed.
//
//   1) Load TradingConfig from the JSON file named on the command line
//      (defaults if none is given).
//   2) Seed the channel info provider with the configured channel state.
//   3) Build the TradeEntrySession, subscribe a logger for
//      TradeValuesChangedEvent and start it. The session's price feed thread
//      connects to price_feed_endpoint and pushes each bid/ask tick into the
//      session loop.
//   4) Wait for Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread          → waits for SIGINT
//   session loop thread  → TradeValuesChangeNotifier + logger callback
//   price feed thread    → PriceFeedGateway ZMQ recv loop
// -----------------------------------------------------------------------------

#include "tradecalc/config/config_loader.hpp"
#include "tradecalc/domain/direction.hpp"
#include "tradecalc/domain/trade_values_snapshot.hpp"
#include "tradecalc/engine/trade_entry_session.hpp"
#include "tradecalc/events/event_types.hpp"
#include "tradecalc/service/configured_channel_info_provider.hpp"
#include "tradecalc/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <thread>

namespace {

// Set from the SIGINT handler; polled by main(). A lock-free atomic store is
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

template <typename T>
void printOptional(std::ostream& os, const std::optional<T>& value) {
  if (value) {
    os << *value;
  } else {
    os << "-";
  }
}

void printSide(std::ostream& os, const tradecalc::domain::TradeValuesSnapshot& s) {
  os << tradecalc::domain::toString(s.direction) << " price=";
  printOptional(os, s.price);
  os << " qty=" << s.quantity << " lev=" << s.leverage << " margin=";
  if (s.margin) {
    os << s.margin->sats;
  } else {
    os << "-";
  }
  os << " liq=";
  printOptional(os, s.liquidation_price);
  os << " fee=";
  if (s.fee) {
    os << s.fee->sats;
  } else {
    os << "-";
  }
  os << " max_qty=";
  printOptional(os, s.max_quantity);
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  tradecalc::domain::TradingConfig config;
  try {
    if (argc > 1) {
      config = tradecalc::ConfigLoader::loadFromFile(argv[1]);
      std::cout << "[main] loaded config from " << argv[1] << "\n";
    } else {
      std::cout << "[main] no config file given, using defaults.\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] network=" << tradecalc::ConfigLoader::toString(config.network)
            << " mmr=" << config.maintenance_margin_rate
            << " fee_rate=" << config.order_matching_fee_rate
            << " default_leverage=" << config.default_leverage << "\n";

  // -------------------------------------------------------------------------
  // 2) Collaborators
  // -------------------------------------------------------------------------
  tradecalc::LiveTimeProvider clock;
  tradecalc::ConfiguredChannelInfoProvider channel_info(config.channel);

  // -------------------------------------------------------------------------
  // 3) Session
  // -------------------------------------------------------------------------
  tradecalc::TradeEntrySession session(config, channel_info, clock);

  // Runs on the session loop thread.
  session.eventBus().subscribe<tradecalc::TradeValuesChangedEvent>(
      [](const tradecalc::TradeValuesChangedEvent& e) {
        std::cout << "[TradeValues] #" << e.sequence_id << " ";
        printSide(std::cout, e.long_values);
        std::cout << " | ";
        printSide(std::cout, e.short_values);
        std::cout << "\n";
      });

  try {
    session.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start session: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "[main] SIGINT received. Stopping session...\n";
  session.stop();

  return 0;
}
