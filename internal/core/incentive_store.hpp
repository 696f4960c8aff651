#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/authorization.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/core/id_allocator.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

/*
  Manufacturer-funded reward programs.

  Budget invariant: 0 <= remaining_budget <= total_budget, and an active
  program always has remaining_budget > 0. Programs are never deleted.
*/
class IncentiveStore {
 public:
  explicit IncentiveStore(EngineContext ctx);

  scavenger::ledger::v1::IncentiveProgram Create(const std::string& issuer, scavenger::ledger::v1::WasteCategory category, uint64_t reward_rate,
                                                 uint64_t total_budget);

  // Keeps the amount already spent; a budget below it exhausts the program.
  scavenger::ledger::v1::IncentiveProgram Update(uint64_t id, const std::string& caller, uint64_t reward_rate, uint64_t total_budget);

  scavenger::ledger::v1::IncentiveProgram SetActive(uint64_t id, const std::string& caller, bool active);

  std::optional<scavenger::ledger::v1::IncentiveProgram> ById(uint64_t id);
  bool                                                   Exists(uint64_t id);
  std::vector<uint64_t>                                  ByIssuer(const std::string& issuer);
  std::vector<uint64_t>                                  ByCategory(scavenger::ledger::v1::WasteCategory category);

  // Highest reward rate among the issuer's active programs for the category.
  std::optional<scavenger::ledger::v1::IncentiveProgram> BestActiveFor(const std::string& issuer, scavenger::ledger::v1::WasteCategory category);

  // Active programs for the category, highest rate first, ties by creation order.
  std::vector<scavenger::ledger::v1::IncentiveProgram> AllActiveFor(scavenger::ledger::v1::WasteCategory category);

 private:
  EngineContext ctx_;
  Authorizer    auth_;
  IdAllocator   ids_;
};

} // namespace scavenger::core
