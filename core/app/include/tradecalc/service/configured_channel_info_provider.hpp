#pragma once

#include "tradecalc/service/i_channel_info_provider.hpp"

#include <mutex>
#include <optional>

namespace tradecalc {

// -----------------------------------------------------------------------------
// ConfiguredChannelInfoProvider: IChannelInfoProvider backed by plain values
// -----------------------------------------------------------------------------
//
// @brief  Holds the channel constraints and open position in memory.
//
// @details
// Seeded from TradingConfig::channel at startup. Whoever observes the channel
// (the wallet layer, a test) pushes updates through the setters; readers get
// copies taken under the lock.
//
// After an update, call TradeValuesChangeNotifier::recalculateMaxQuantity()
// so the cached max quantities pick up the new constraints.
// -----------------------------------------------------------------------------
class ConfiguredChannelInfoProvider final : public IChannelInfoProvider {
 public:
  explicit ConfiguredChannelInfoProvider(
      domain::ChannelTradeConstraints constraints,
      std::optional<domain::OpenPosition> position = std::nullopt);

  ConfiguredChannelInfoProvider(const ConfiguredChannelInfoProvider&) = delete;
  ConfiguredChannelInfoProvider& operator=(
      const ConfiguredChannelInfoProvider&) = delete;

  domain::ChannelTradeConstraints channelTradeConstraints() const override;
  std::optional<domain::OpenPosition> openPosition() const override;
  domain::Amount minTradeMargin() const override;

  void setChannelTradeConstraints(domain::ChannelTradeConstraints constraints);
  void setOpenPosition(std::optional<domain::OpenPosition> position);

 private:
  mutable std::mutex mutex_;
  domain::ChannelTradeConstraints constraints_;
  std::optional<domain::OpenPosition> position_;
};

}  // namespace tradecalc
