#pragma once

#include "tradecalc/events/event.hpp"
#include "tradecalc/events/event_types.hpp"
#include "tradecalc/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tradecalc {

// -----------------------------------------------------------------------------
// PriceFeedGateway: ZeroMQ bridge for orderbook bid/ask ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded best bid/ask ticks
//         and hands each one to an event sink as a PriceUpdateEvent.
//
// @details
// Expected JSON format from the orderbook publisher:
//   {
//     "ask":          30209.5,          // number or null
//     "bid":          30190.0,          // number or null
//     "timestamp_ms": 1700000000000     // optional int64 epoch milliseconds
//   }
// A side that is null or absent means the orderbook has no price on that
// side; the matching TradeValues drops its derived fields until it returns.
//
// When a SimulationTimeProvider is attached, every tick carrying a
// timestamp_ms advances it before the event is handed on, so replayed feeds
// produce the expiry timestamps of the replay day.
//
// Malformed payloads are logged to std::cerr and skipped.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (PriceFeedThread does).
//   stop() may be called from any thread. The socket uses ZMQ_RCVTIMEO so
//   recv() returns at least every kRecvTimeoutMs and the stop flag is seen.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t. Holds a copy of the sink and
//   an optional non-owning pointer to the simulation clock.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // Opens the SUB socket, subscribes to everything and connects to
  // `endpoint`. Throws zmq::error_t if the endpoint is invalid.
  PriceFeedGateway(EventSink event_sink, const std::string& endpoint,
                   SimulationTimeProvider* clock = nullptr);

  ~PriceFeedGateway() = default;

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  // Blocking recv loop; returns after stop().
  void run();

  void stop();

  // Decodes one payload. std::nullopt (with a line on std::cerr) if it is
  // not a JSON object, or if ask, bid or timestamp_ms has the wrong type.
  static std::optional<PriceUpdateEvent> parsePriceTick(
      const std::string& payload);

  std::uint64_t ticksReceived() const { return ticks_received_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  SimulationTimeProvider* clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_received_{0};
};

}  // namespace tradecalc
