#pragma once

#include <cstdint>
#include <string>

#include "scavenger/ledger/v1/types.pb.h"

namespace scavenger::db::model {

/*
  Persistent incentive program row.

  Invariant: 0 <= remaining_budget <= total_budget.
*/

struct IncentiveRecord {
  uint64_t    id = 0;
  std::string issuer;

  scavenger::ledger::v1::WasteCategory category = scavenger::ledger::v1::WASTE_CATEGORY_UNSPECIFIED;

  // reward units per kilogram
  uint64_t reward_rate      = 0;
  uint64_t total_budget     = 0;
  uint64_t remaining_budget = 0;

  bool     active        = true;
  uint64_t created_at_ms = 0;
};

} // namespace scavenger::db::model
