#pragma once

#include "tradecalc/domain/trading_config.hpp"
#include "tradecalc/time/time_utils.hpp"

namespace tradecalc {

// -----------------------------------------------------------------------------
// Expiry schedule
// -----------------------------------------------------------------------------
//
// @brief  Calendar rules for contract expiry and the rollover window.
//
// @details
// Mainnet contracts expire weekly on Sunday at 15:00 UTC. The rollover
// window opens two days earlier, on Friday at 15:00 UTC; a trade opened
// inside the window, or on a Sunday, expires on the following week's Sunday
// instead.
//
// On test networks contracts expire at the next midnight UTC, and a trade
// opened less than 8 hours before that midnight expires a day later.
//
// All computations are in UTC and independent of the local time zone.
// -----------------------------------------------------------------------------

/// True if `timestamp` lies inside the rollover window of `network`.
bool isEligibleForRollover(Timestamp timestamp, domain::Network network);

/// Expiry of a trade opened at `timestamp`.
Timestamp calculateNextExpiry(Timestamp timestamp, domain::Network network);

}  // namespace tradecalc
