#pragma once

#include <cstdint>
#include <string>

namespace scavenger::db::model {

// Lifetime reward credited to one participant by settlement.
struct EarningsRecord {
  std::string participant;
  uint64_t    total_earned  = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace scavenger::db::model
