#pragma once

#include <set>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/core/collaborators.hpp"

namespace scavenger::directory {

/*
  Participant directory fixed at startup.

  Capabilities by configured role:
    recycler      participate, submit
    collector     participate, submit, collect
    manufacturer  participate, manufacture
  admin: true adds administer. Unknown participants hold nothing.
*/
class StaticParticipantDirectory final : public scavenger::core::ParticipantDirectory {
 public:
  StaticParticipantDirectory() = default;

  static StaticParticipantDirectory FromConfig(const scavenger::runtime::config::RuntimeConfig& config);

  // Replaces any earlier entry for the same id. Throws util::InvalidInput on unknown roles.
  void Register(const std::string& participant, const std::string& role, bool admin = false);

  bool HasCapability(const std::string& participant, scavenger::core::Capability capability) const override;

 private:
  std::unordered_map<std::string, std::set<scavenger::core::Capability>> capabilities_;
};

} // namespace scavenger::directory
