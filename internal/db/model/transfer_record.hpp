#pragma once

#include <cstdint>
#include <string>

namespace scavenger::db::model {

/*
  One ownership move of a waste unit. Append-only.
*/

struct TransferRecord {
  uint64_t id       = 0;
  uint64_t waste_id = 0;

  std::string from;
  std::string to;

  // epoch ms, non-decreasing per waste id
  uint64_t timestamp_ms = 0;

  std::string note;
};

} // namespace scavenger::db::model
