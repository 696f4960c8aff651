#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/core/collaborators.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

/*
  Single home for every permission decision the engine makes.

  Roles are derived from directory capabilities, strongest first:
    kManufacture -> MANUFACTURER
    kCollect     -> COLLECTOR
    kSubmit      -> RECYCLER

  Legal ownership moves:
    RECYCLER  -> COLLECTOR
    RECYCLER  -> MANUFACTURER
    COLLECTOR -> MANUFACTURER
*/
class Authorizer {
 public:
  explicit Authorizer(std::shared_ptr<ParticipantDirectory> directory);

  scavenger::ledger::v1::ParticipantRole RoleOf(const std::string& participant) const;

  bool Has(const std::string& participant, Capability capability) const;

  // Throws util::Unauthorized naming the action when the capability is missing.
  void Require(const std::string& participant, Capability capability, std::string_view action) const;

  bool CanTransfer(const std::string& from, const std::string& to) const;

  static bool IsAllowedTransition(scavenger::ledger::v1::ParticipantRole from, scavenger::ledger::v1::ParticipantRole to);

 private:
  std::shared_ptr<ParticipantDirectory> directory_;
};

} // namespace scavenger::core
