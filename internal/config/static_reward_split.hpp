#pragma once

#include "config/config.pb.h"
#include "internal/core/collaborators.hpp"

namespace scavenger::config {

// Reward split fixed by the settlement section of the runtime config.
class StaticRewardSplit final : public scavenger::core::RewardSplitSource {
 public:
  // Throws util::InvalidInput when the shares sum past 100.
  explicit StaticRewardSplit(scavenger::core::RewardSplit split);

  static StaticRewardSplit FromConfig(const scavenger::runtime::config::SettlementConfig& config);

  scavenger::core::RewardSplit Split() const override {
    return split_;
  }

 private:
  scavenger::core::RewardSplit split_;
};

} // namespace scavenger::config
