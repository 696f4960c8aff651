#include "static_participant_directory.hpp"

#include "internal/util/errors.hpp"

namespace scavenger::directory {

using scavenger::core::Capability;

StaticParticipantDirectory StaticParticipantDirectory::FromConfig(const scavenger::runtime::config::RuntimeConfig& config) {
  StaticParticipantDirectory directory;
  for (const auto& participant : config.participants()) {
    directory.Register(participant.id(), participant.role(), participant.admin());
  }
  return directory;
}

void StaticParticipantDirectory::Register(const std::string& participant, const std::string& role, bool admin) {
  std::set<Capability> granted{Capability::kParticipate};

  if (role == "recycler") {
    granted.insert(Capability::kSubmit);
  } else if (role == "collector") {
    granted.insert(Capability::kSubmit);
    granted.insert(Capability::kCollect);
  } else if (role == "manufacturer") {
    granted.insert(Capability::kManufacture);
  } else {
    throw scavenger::util::InvalidInput("participant '" + participant + "' has unknown role '" + role + "'");
  }

  if (admin) {
    granted.insert(Capability::kAdminister);
  }

  capabilities_[participant] = std::move(granted);
}

bool StaticParticipantDirectory::HasCapability(const std::string& participant, Capability capability) const {
  const auto it = capabilities_.find(participant);
  return it != capabilities_.end() && it->second.contains(capability);
}

} // namespace scavenger::directory
