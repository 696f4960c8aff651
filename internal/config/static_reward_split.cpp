#include "static_reward_split.hpp"

#include <cstdint>

#include "internal/util/errors.hpp"

namespace scavenger::config {

StaticRewardSplit::StaticRewardSplit(scavenger::core::RewardSplit split) : split_(split) {
  if (static_cast<uint64_t>(split_.collector_percent) + split_.owner_percent > 100) {
    throw scavenger::util::InvalidInput("reward split percentages must not exceed 100");
  }
}

StaticRewardSplit StaticRewardSplit::FromConfig(const scavenger::runtime::config::SettlementConfig& config) {
  return StaticRewardSplit(scavenger::core::RewardSplit{config.collector_percent(), config.owner_percent()});
}

} // namespace scavenger::config
