#include "tradecalc/time/expiry_schedule.hpp"

#include <cstdint>

namespace tradecalc {

namespace {

constexpr std::int64_t kExpirySecondOfDay = 15 * kSecondsPerHour;
constexpr std::int64_t kRolloverSecondsBeforeMidnight = 8 * kSecondsPerHour;

}  // namespace

bool isEligibleForRollover(Timestamp timestamp, domain::Network network) {
  const UtcDay day = to_utc_day(timestamp);

  if (network == domain::Network::Bitcoin) {
    switch (day.weekday()) {
      case Weekday::Friday:
        return day.seconds_of_day >= kExpirySecondOfDay;
      case Weekday::Saturday:
        return true;
      case Weekday::Sunday:
        return day.seconds_of_day < kExpirySecondOfDay;
      default:
        return false;
    }
  }

  const std::int64_t seconds_to_midnight =
      kSecondsPerDay - day.seconds_of_day;
  return seconds_to_midnight < kRolloverSecondsBeforeMidnight;
}

Timestamp calculateNextExpiry(Timestamp timestamp, domain::Network network) {
  const UtcDay day = to_utc_day(timestamp);

  if (network == domain::Network::Bitcoin) {
    std::int64_t days_ahead = static_cast<int>(Weekday::Sunday) -
                              static_cast<int>(day.weekday());
    if (isEligibleForRollover(timestamp, network) ||
        day.weekday() == Weekday::Sunday) {
      days_ahead += 7;
    }
    return from_utc_day(day.days_since_epoch + days_ahead,
                        kExpirySecondOfDay);
  }

  const std::int64_t days_ahead =
      isEligibleForRollover(timestamp, network) ? 2 : 1;
  return from_utc_day(day.days_since_epoch + days_ahead, 0);
}

}  // namespace tradecalc
