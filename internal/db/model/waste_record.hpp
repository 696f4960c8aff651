#pragma once

#include <cstdint>
#include <string>

#include "scavenger/ledger/v1/types.pb.h"

namespace scavenger::db::model {

/*
  Persistent waste unit row.

  IMPORTANT:
  - submitter, category, location and created_at_ms never change after insert.
  - is_active only ever goes from true to false.
*/

struct WasteRecord {
  uint64_t id = 0;

  scavenger::ledger::v1::WasteCategory category = scavenger::ledger::v1::WASTE_CATEGORY_UNSPECIFIED;

  // grams; 0 only for a bulk hand-off awaiting weighing
  uint64_t weight_grams = 0;

  std::string submitter;
  std::string current_owner;

  scavenger::ledger::v1::WasteStatus status = scavenger::ledger::v1::WASTE_STATUS_PENDING;

  bool        is_confirmed = false;
  std::string confirmer;
  bool        is_active = true;

  int64_t     latitude  = 0;
  int64_t     longitude = 0;
  std::string description;

  uint64_t created_at_ms = 0;
};

} // namespace scavenger::db::model
