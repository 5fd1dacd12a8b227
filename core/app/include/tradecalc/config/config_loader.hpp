#pragma once

#include "tradecalc/domain/trading_config.hpp"

#include <string>

namespace tradecalc {

// -----------------------------------------------------------------------------
// ConfigLoader: TradingConfig from JSON
// -----------------------------------------------------------------------------
//
// @brief  Reads a TradingConfig (including the initial channel state) from a
//         JSON document using nlohmann/json.
//
// @details
// Every key is optional; a missing key keeps the TradingConfig default. A
// key that is present must have the right type and range:
//
//   network                  "bitcoin" | "testnet" | "signet" | "regtest"
//   maintenance_margin_rate  number in [0, 1)
//   order_matching_fee_rate  number in [0, 1)
//   default_leverage         number in [1, max_leverage]
//   max_leverage             number >= 1
//   price_feed_endpoint      string ("" disables the feed)
//   channel.*_sats           non-negative integer
//   channel.coordinator_leverage  number > 0
//   channel.is_channel_balance    bool
//
// and maintenance_margin_rate * max_leverage must stay below 1.
//
// Errors:
//   Throws std::runtime_error naming the offending key. JSON syntax and
//   type errors from nlohmann are rethrown as std::runtime_error too, so
//   callers catch a single type.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static domain::TradingConfig loadFromFile(const std::string& path);
  static domain::TradingConfig loadFromString(const std::string& json_text);

  // Throws std::runtime_error if `config` violates the ranges above.
  static void validate(const domain::TradingConfig& config);

  static domain::Network parseNetwork(const std::string& name);
  static const char* toString(domain::Network network);
};

}  // namespace tradecalc
