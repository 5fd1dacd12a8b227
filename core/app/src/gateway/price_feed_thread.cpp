#include "tradecalc/gateway/price_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace tradecalc {

PriceFeedThread::PriceFeedThread(EventSink event_sink, std::string endpoint,
                                 SimulationTimeProvider* clock)
    : event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      clock_(clock) {}

PriceFeedThread::~PriceFeedThread() { stop(); }

void PriceFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<PriceFeedGateway>(event_sink_, endpoint_, clock_);

  thread_ = std::thread([this] {
    std::cout << "[PriceFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[PriceFeedThread] recv loop exited after "
              << gateway_->ticksReceived() << " ticks.\n";
  });
}

void PriceFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace tradecalc
