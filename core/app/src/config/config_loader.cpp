#include "tradecalc/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tradecalc {

namespace {

using nlohmann::json;

std::runtime_error configError(const std::string& key,
                               const std::string& what) {
  return std::runtime_error("[ConfigLoader] " + key + ": " + what);
}

// Overwrites `out` only if `key` is present.
void readNumber(const json& obj, const char* key, double& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_number()) {
    throw configError(key, "expected a number");
  }
  out = it->get<double>();
}

void readSats(const json& obj, const char* key, domain::Amount& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_number_integer()) {
    throw configError(key, "expected an integer amount of sats");
  }
  std::int64_t sats = it->get<std::int64_t>();
  if (sats < 0) {
    throw configError(key, "must not be negative");
  }
  out = domain::Amount{sats};
}

domain::ChannelTradeConstraints readChannel(
    const json& obj, domain::ChannelTradeConstraints channel) {
  if (!obj.is_object()) {
    throw configError("channel", "expected an object");
  }

  readSats(obj, "max_local_balance_sats", channel.max_local_balance);
  readSats(obj, "max_counterparty_balance_sats",
           channel.max_counterparty_balance);
  readNumber(obj, "coordinator_leverage", channel.coordinator_leverage);
  readSats(obj, "min_margin_sats", channel.min_margin);
  readSats(obj, "estimated_fee_reserve_sats", channel.estimated_fee_reserve);
  readSats(obj, "estimated_funding_tx_fee_sats",
           channel.estimated_funding_tx_fee);

  if (auto it = obj.find("is_channel_balance"); it != obj.end()) {
    if (!it->is_boolean()) {
      throw configError("is_channel_balance", "expected true or false");
    }
    channel.is_channel_balance = it->get<bool>();
  }

  if (auto it = obj.find("total_collateral_sats"); it != obj.end()) {
    if (it->is_null()) {
      channel.total_collateral.reset();
    } else {
      domain::Amount total;
      readSats(obj, "total_collateral_sats", total);
      channel.total_collateral = total;
    }
  }

  return channel;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFromFile()
// -----------------------------------------------------------------------------
domain::TradingConfig ConfigLoader::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("[ConfigLoader] cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return loadFromString(buffer.str());
}

// -----------------------------------------------------------------------------
// loadFromString()
// -----------------------------------------------------------------------------
domain::TradingConfig ConfigLoader::loadFromString(
    const std::string& json_text) {
  domain::TradingConfig config;

  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw std::runtime_error("[ConfigLoader] top level must be an object");
    }

    if (auto it = root.find("network"); it != root.end()) {
      if (!it->is_string()) {
        throw configError("network", "expected a string");
      }
      config.network = parseNetwork(it->get<std::string>());
    }

    readNumber(root, "maintenance_margin_rate", config.maintenance_margin_rate);
    readNumber(root, "order_matching_fee_rate", config.order_matching_fee_rate);
    readNumber(root, "default_leverage", config.default_leverage);
    readNumber(root, "max_leverage", config.max_leverage);

    if (auto it = root.find("price_feed_endpoint"); it != root.end()) {
      if (!it->is_string()) {
        throw configError("price_feed_endpoint", "expected a string");
      }
      config.price_feed_endpoint = it->get<std::string>();
    }

    if (auto it = root.find("channel"); it != root.end()) {
      config.channel = readChannel(*it, config.channel);
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("[ConfigLoader] invalid JSON: ") +
                             e.what());
  }

  validate(config);
  return config;
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void ConfigLoader::validate(const domain::TradingConfig& config) {
  if (config.maintenance_margin_rate < 0.0 ||
      config.maintenance_margin_rate >= 1.0) {
    throw configError("maintenance_margin_rate", "must be in [0, 1)");
  }
  if (config.order_matching_fee_rate < 0.0 ||
      config.order_matching_fee_rate >= 1.0) {
    throw configError("order_matching_fee_rate", "must be in [0, 1)");
  }
  if (config.max_leverage < 1.0) {
    throw configError("max_leverage", "must be at least 1");
  }
  if (config.default_leverage < 1.0 ||
      config.default_leverage > config.max_leverage) {
    throw configError("default_leverage", "must be in [1, max_leverage]");
  }
  if (config.maintenance_margin_rate * config.max_leverage >= 1.0) {
    throw configError("maintenance_margin_rate",
                      "times max_leverage must be below 1");
  }
  if (config.channel.coordinator_leverage <= 0.0) {
    throw configError("coordinator_leverage", "must be positive");
  }
}

domain::Network ConfigLoader::parseNetwork(const std::string& name) {
  if (name == "bitcoin" || name == "mainnet") {
    return domain::Network::Bitcoin;
  }
  if (name == "testnet") {
    return domain::Network::Testnet;
  }
  if (name == "signet") {
    return domain::Network::Signet;
  }
  if (name == "regtest") {
    return domain::Network::Regtest;
  }
  throw configError("network", "unknown network '" + name + "'");
}

const char* ConfigLoader::toString(domain::Network network) {
  switch (network) {
    case domain::Network::Bitcoin:
      return "bitcoin";
    case domain::Network::Testnet:
      return "testnet";
    case domain::Network::Signet:
      return "signet";
    case domain::Network::Regtest:
      return "regtest";
  }
  return "unknown";
}

}  // namespace tradecalc
