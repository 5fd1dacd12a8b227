#include "tradecalc/service/configured_channel_info_provider.hpp"

#include <utility>

namespace tradecalc {

ConfiguredChannelInfoProvider::ConfiguredChannelInfoProvider(
    domain::ChannelTradeConstraints constraints,
    std::optional<domain::OpenPosition> position)
    : constraints_(std::move(constraints)), position_(std::move(position)) {}

domain::ChannelTradeConstraints
ConfiguredChannelInfoProvider::channelTradeConstraints() const {
  std::lock_guard lock(mutex_);
  return constraints_;
}

std::optional<domain::OpenPosition>
ConfiguredChannelInfoProvider::openPosition() const {
  std::lock_guard lock(mutex_);
  return position_;
}

domain::Amount ConfiguredChannelInfoProvider::minTradeMargin() const {
  std::lock_guard lock(mutex_);
  return constraints_.min_margin;
}

void ConfiguredChannelInfoProvider::setChannelTradeConstraints(
    domain::ChannelTradeConstraints constraints) {
  std::lock_guard lock(mutex_);
  constraints_ = std::move(constraints);
}

void ConfiguredChannelInfoProvider::setOpenPosition(
    std::optional<domain::OpenPosition> position) {
  std::lock_guard lock(mutex_);
  position_ = std::move(position);
}

}  // namespace tradecalc
