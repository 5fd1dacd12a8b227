#pragma once

#include "tradecalc/events/event.hpp"
#include "tradecalc/gateway/price_feed_gateway.hpp"
#include "tradecalc/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradecalc {

// -----------------------------------------------------------------------------
// PriceFeedThread: dedicated I/O thread for the price feed
// -----------------------------------------------------------------------------
//
// @brief  Runs a PriceFeedGateway recv loop on its own std::thread so the
//         session's loop thread never blocks on the network.
//
// @details
// The gateway is created in start(), not in the constructor, so a session
// can be built (and tested) without opening a socket.
//
// Thread model:
//   start() and stop() are called from the owning thread (the session's
//   owner). The internal thread only runs PriceFeedGateway::run().
//
// Ownership:
//   Owned by TradeEntrySession via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class PriceFeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  PriceFeedThread(EventSink event_sink, std::string endpoint,
                  SimulationTimeProvider* clock = nullptr);

  ~PriceFeedThread();

  PriceFeedThread(const PriceFeedThread&) = delete;
  PriceFeedThread& operator=(const PriceFeedThread&) = delete;
  PriceFeedThread(PriceFeedThread&&) = delete;
  PriceFeedThread& operator=(PriceFeedThread&&) = delete;

  // Opens the socket and spawns the recv thread. No-op if running.
  void start();

  // Signals the gateway and joins. Returns within the gateway's receive
  // timeout. Safe if never started.
  void stop();

  const std::string& endpoint() const { return endpoint_; }

 private:
  EventSink event_sink_;
  std::string endpoint_;
  SimulationTimeProvider* clock_;

  std::unique_ptr<PriceFeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace tradecalc
