#include "tradecalc/gateway/price_feed_gateway.hpp"
#include "tradecalc/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace tradecalc {

namespace {

// null and absent both mean "no price on this side".
std::optional<double> readSide(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

}  // namespace

PriceFeedGateway::PriceFeedGateway(EventSink event_sink,
                                   const std::string& endpoint,
                                   SimulationTimeProvider* clock)
    : event_sink_(std::move(event_sink)), clock_(clock) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parsePriceTick(): JSON payload → PriceUpdateEvent
// -----------------------------------------------------------------------------
std::optional<PriceUpdateEvent> PriceFeedGateway::parsePriceTick(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    if (!json.is_object()) {
      std::cerr << "[PriceFeedGateway] expected a JSON object, got: "
                << payload << "\n";
      return std::nullopt;
    }

    PriceUpdateEvent tick;
    tick.price.ask = readSide(json, "ask");
    tick.price.bid = readSide(json, "bid");

    auto ts = json.find("timestamp_ms");
    if (ts != json.end() && !ts->is_null()) {
      tick.timestamp = ms_to_timestamp(ts->get<std::int64_t>());
    } else {
      tick.timestamp = std::chrono::system_clock::now();
    }
    return tick;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PriceFeedGateway] JSON parse error: " << e.what()
              << "; payload: " << payload << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void PriceFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      // Timed out; re-check the stop flag.
      continue;
    }

    std::optional<PriceUpdateEvent> tick = parsePriceTick(msg.to_string());
    if (!tick) {
      continue;
    }

    tick->sequence_id = ++ticks_received_;

    // Clock first, so anything reading now_ms() while handling this tick
    // sees the tick's time.
    if (clock_ != nullptr) {
      clock_->advance_time(timestamp_to_ms(tick->timestamp));
    }

    event_sink_(std::move(*tick));
  }
}

void PriceFeedGateway::stop() { running_.store(false); }

}  // namespace tradecalc
