#include "tradecalc/time/live_time_provider.hpp"
#include "tradecalc/time/time_utils.hpp"

namespace tradecalc {

std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace tradecalc
