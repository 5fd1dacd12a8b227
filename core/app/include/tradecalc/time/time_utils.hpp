#pragma once

#include <chrono>
#include <cstdint>

namespace tradecalc {

// Wall-clock time carried by events and expiry timestamps.
using Timestamp = std::chrono::system_clock::time_point;

// ITimeProvider and the JSON price feed speak int64 epoch milliseconds;
// events and TradeValues carry Timestamp.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// UTC calendar helpers
// -----------------------------------------------------------------------------
// The expiry calendar only needs the UTC weekday and the time of day, so a
// timestamp is split into whole days since the epoch and seconds since that
// day's midnight. Timestamps before 1970 round towards the earlier day.
// -----------------------------------------------------------------------------
constexpr std::int64_t kSecondsPerHour = 3'600;
constexpr std::int64_t kSecondsPerDay = 86'400;

// ISO weekday numbers.
enum class Weekday : int {
  Monday = 1,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday,
  Sunday,
};

struct UtcDay {
  std::int64_t days_since_epoch{0};
  std::int64_t seconds_of_day{0};

  Weekday weekday() const {
    // 1970-01-01 was a Thursday.
    const std::int64_t offset = ((days_since_epoch % 7) + 7) % 7;
    return static_cast<Weekday>((offset + 3) % 7 + 1);
  }
};

inline std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

inline UtcDay to_utc_day(Timestamp tp) {
  const std::int64_t seconds = floor_div(timestamp_to_ms(tp), 1'000);
  UtcDay day;
  day.days_since_epoch = floor_div(seconds, kSecondsPerDay);
  day.seconds_of_day = seconds - day.days_since_epoch * kSecondsPerDay;
  return day;
}

inline Timestamp from_utc_day(std::int64_t days_since_epoch,
                              std::int64_t seconds_of_day) {
  return ms_to_timestamp(
      (days_since_epoch * kSecondsPerDay + seconds_of_day) * 1'000);
}

}  // namespace tradecalc
