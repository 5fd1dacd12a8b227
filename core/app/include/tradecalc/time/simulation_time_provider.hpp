#pragma once

#include "tradecalc/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradecalc {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever advance_time() last stored.
//
// @details
// Used where expiry timestamps must be reproducible: unit tests pin the
// clock to a known weekday and hour, and the price feed gateway advances it
// to the timestamp carried by each replayed tick.
//
// Thread model:
//   One writer (the gateway thread or the test), many readers. Both
//   operations are single atomic accesses.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Callers are expected to move it forward only.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradecalc
