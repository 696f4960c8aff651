#include "authorization.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;

std::string_view CapabilityName(Capability capability) {
  switch (capability) {
    case Capability::kParticipate:
      return "participate";
    case Capability::kSubmit:
      return "submit";
    case Capability::kCollect:
      return "collect";
    case Capability::kManufacture:
      return "manufacture";
    case Capability::kAdminister:
      return "administer";
  }
  return "unknown";
}

Authorizer::Authorizer(std::shared_ptr<ParticipantDirectory> directory) : directory_(std::move(directory)) {
  if (!directory_) {
    throw std::invalid_argument("Authorizer requires a participant directory");
  }
}

ParticipantRole Authorizer::RoleOf(const std::string& participant) const {
  if (directory_->HasCapability(participant, Capability::kManufacture)) return PARTICIPANT_ROLE_MANUFACTURER;
  if (directory_->HasCapability(participant, Capability::kCollect)) return PARTICIPANT_ROLE_COLLECTOR;
  if (directory_->HasCapability(participant, Capability::kSubmit)) return PARTICIPANT_ROLE_RECYCLER;
  return PARTICIPANT_ROLE_UNSPECIFIED;
}

bool Authorizer::Has(const std::string& participant, Capability capability) const {
  return directory_->HasCapability(participant, capability);
}

void Authorizer::Require(const std::string& participant, Capability capability, std::string_view action) const {
  if (!Has(participant, capability)) {
    throw scavenger::util::Unauthorized(std::string(action) + ": participant '" + participant + "' lacks capability " +
                                        std::string(CapabilityName(capability)));
  }
}

bool Authorizer::CanTransfer(const std::string& from, const std::string& to) const {
  return IsAllowedTransition(RoleOf(from), RoleOf(to));
}

bool Authorizer::IsAllowedTransition(ParticipantRole from, ParticipantRole to) {
  switch (from) {
    case PARTICIPANT_ROLE_RECYCLER:
      return to == PARTICIPANT_ROLE_COLLECTOR || to == PARTICIPANT_ROLE_MANUFACTURER;
    case PARTICIPANT_ROLE_COLLECTOR:
      return to == PARTICIPANT_ROLE_MANUFACTURER;
    default:
      return false;
  }
}

} // namespace scavenger::core
