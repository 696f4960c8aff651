#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "scavenger/ledger/v1/types.pb.h"

namespace scavenger::db::model {

// Running submission totals for one participant. Only direct submissions
// count; bulk hand-offs and weight finalization leave it alone.
struct ParticipantActivityRecord {
  std::string participant;
  uint64_t    total_submissions  = 0;
  uint64_t    total_weight_grams = 0;

  std::map<scavenger::ledger::v1::WasteCategory, uint64_t> submissions_by_category;

  uint64_t updated_at_ms = 0;
};

} // namespace scavenger::db::model
