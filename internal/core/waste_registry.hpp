#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/authorization.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/core/id_allocator.hpp"
#include "internal/db/model/waste_record.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

/*
  Canonical waste unit records.

  Status machine:
    PENDING, PROCESSING   modifiable
    PROCESSED, REJECTED   terminal

  Confirmation is held by at most one party other than the current owner at
  a time; only the owner can clear it. Deactivation is permanent and turns
  every later mutation into util::InvalidState.
*/
class WasteRegistry {
 public:
  explicit WasteRegistry(EngineContext ctx);

  scavenger::ledger::v1::WasteUnit Submit(scavenger::ledger::v1::WasteCategory category, uint64_t weight_grams, const std::string& submitter,
                                          const scavenger::ledger::v1::Location& location);

  // All items are validated, and their weights summed with overflow checks,
  // before the first id is allocated. Units get consecutive ids in item order.
  std::vector<scavenger::ledger::v1::WasteUnit> SubmitBatch(const std::vector<scavenger::ledger::v1::WasteSubmission>& items,
                                                            const std::string& submitter);

  // false (and no write) when the current status is terminal.
  bool UpdateStatus(uint64_t id, scavenger::ledger::v1::WasteStatus status);

  scavenger::ledger::v1::WasteUnit Confirm(uint64_t id, const std::string& confirmer);
  scavenger::ledger::v1::WasteUnit ResetConfirmation(uint64_t id, const std::string& caller);
  scavenger::ledger::v1::WasteUnit Deactivate(uint64_t id, const std::string& caller);

  // Sets the weight of a unit created by a bulk hand-off.
  scavenger::ledger::v1::WasteUnit FinalizeWeight(uint64_t id, const std::string& caller, uint64_t weight_grams);

  std::optional<scavenger::ledger::v1::WasteUnit> Get(uint64_t id);
  bool                                            Exists(uint64_t id);

  // One slot per requested id, in request order; absent ids are nullopt.
  std::vector<std::optional<scavenger::ledger::v1::WasteUnit>> GetBatch(const std::vector<uint64_t>& ids);

  std::vector<uint64_t>                           ParticipantWastes(const std::string& participant);

  static bool IsModifiable(scavenger::ledger::v1::WasteStatus status);

 private:
  static void ValidateSubmission(scavenger::ledger::v1::WasteCategory category, uint64_t weight_grams, const std::string& context);

  scavenger::db::model::WasteRecord InsertSubmission(scavenger::db::Transaction& tx, scavenger::ledger::v1::WasteCategory category,
                                                     uint64_t weight_grams, const std::string& submitter,
                                                     const scavenger::ledger::v1::Location& location, uint64_t now, const std::string& context);

  // Adds `records` to the submitter's running submission totals.
  void RecordActivity(scavenger::db::Transaction& tx, const std::string& submitter,
                      const std::vector<scavenger::db::model::WasteRecord>& records, uint64_t now, const std::string& context);

  void PublishSubmitted(const scavenger::db::model::WasteRecord& record);

  EngineContext ctx_;
  Authorizer    auth_;
  IdAllocator   ids_;
};

} // namespace scavenger::core
