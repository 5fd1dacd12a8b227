#pragma once

#include <cstdint>

namespace tradecalc {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for the contract expiry schedule.
//
// @details
// The expiry of a new trade depends on the current weekday and hour (weekly
// expiry on mainnet, daily elsewhere), so the service that hands out expiry
// timestamps reads the time through this interface instead of calling
// std::chrono::system_clock directly:
//   - LiveTimeProvider        → wall clock, used by the session executable.
//   - SimulationTimeProvider  → set explicitly, used by tests and replays.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch (1970-01-01 00:00:00 UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradecalc
