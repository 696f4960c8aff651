#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/authorization.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/core/id_allocator.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

/*
  Append-only ownership history.

  Every successful move appends exactly one TransferRecord; records are
  never edited or removed and read back in append order. Timestamps never
  go backwards within one waste unit even if the wall clock does.
*/
class TransferLedger {
 public:
  explicit TransferLedger(EngineContext ctx);

  scavenger::ledger::v1::WasteUnit Transfer(uint64_t waste_id, const std::string& from, const std::string& to, const std::string& note);

  // Collector -> manufacturer hand-off of an unweighed batch.
  scavenger::ledger::v1::WasteUnit TransferBulk(scavenger::ledger::v1::WasteCategory category, const std::string& collector,
                                                const std::string& manufacturer, const scavenger::ledger::v1::Location& location,
                                                const std::string& note);

  std::vector<scavenger::ledger::v1::TransferRecord> HistoryOf(uint64_t waste_id);

  bool CanTransfer(const std::string& from, const std::string& to) const;

 private:
  EngineContext ctx_;
  Authorizer    auth_;
  IdAllocator   ids_;
};

} // namespace scavenger::core
