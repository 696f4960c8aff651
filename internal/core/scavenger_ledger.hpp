#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/engine_context.hpp"
#include "internal/core/incentive_store.hpp"
#include "internal/core/reward_settlement.hpp"
#include "internal/core/transfer_ledger.hpp"
#include "internal/core/waste_registry.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

/*
  Public engine surface.

  Each call runs in its own repository transaction and either commits all
  of its writes or none. Rejected calls are logged and rethrown unchanged,
  so callers branch on the util:: error type.
*/
class ScavengerLedger {
 public:
  explicit ScavengerLedger(EngineContext ctx);

  // Waste lifecycle
  scavenger::ledger::v1::WasteUnit SubmitWaste(scavenger::ledger::v1::WasteCategory category, uint64_t weight_grams, const std::string& submitter,
                                               const scavenger::ledger::v1::Location& location);
  std::vector<scavenger::ledger::v1::WasteUnit> SubmitWasteBatch(const std::vector<scavenger::ledger::v1::WasteSubmission>& items,
                                                                 const std::string& submitter);
  scavenger::ledger::v1::WasteUnit TransferWaste(uint64_t waste_id, const std::string& from, const std::string& to, const std::string& note);
  scavenger::ledger::v1::WasteUnit TransferBulkWaste(scavenger::ledger::v1::WasteCategory category, const std::string& collector,
                                                     const std::string& manufacturer, const scavenger::ledger::v1::Location& location,
                                                     const std::string& note);
  scavenger::ledger::v1::WasteUnit FinalizeWasteWeight(uint64_t waste_id, const std::string& caller, uint64_t weight_grams);
  scavenger::ledger::v1::WasteUnit ConfirmWaste(uint64_t waste_id, const std::string& confirmer);
  scavenger::ledger::v1::WasteUnit ResetWasteConfirmation(uint64_t waste_id, const std::string& caller);
  scavenger::ledger::v1::WasteUnit DeactivateWaste(uint64_t waste_id, const std::string& caller);
  bool                             UpdateWasteStatus(uint64_t waste_id, scavenger::ledger::v1::WasteStatus status);

  std::optional<scavenger::ledger::v1::WasteUnit>    GetWaste(uint64_t waste_id);
  bool                                               WasteExists(uint64_t waste_id);
  std::vector<std::optional<scavenger::ledger::v1::WasteUnit>> GetWastesBatch(const std::vector<uint64_t>& waste_ids);
  std::vector<scavenger::ledger::v1::TransferRecord> GetWasteTransferHistory(uint64_t waste_id);
  std::vector<uint64_t>                              GetParticipantWastes(const std::string& participant);
  bool                                               CanTransfer(const std::string& from, const std::string& to);

  // Incentive programs
  scavenger::ledger::v1::IncentiveProgram CreateIncentive(const std::string& issuer, scavenger::ledger::v1::WasteCategory category,
                                                          uint64_t reward_rate, uint64_t total_budget);
  scavenger::ledger::v1::IncentiveProgram UpdateIncentive(uint64_t incentive_id, const std::string& caller, uint64_t reward_rate,
                                                          uint64_t total_budget);
  scavenger::ledger::v1::IncentiveProgram SetIncentiveActive(uint64_t incentive_id, const std::string& caller, bool active);

  std::optional<scavenger::ledger::v1::IncentiveProgram> GetIncentiveById(uint64_t incentive_id);
  bool                                                   IncentiveExists(uint64_t incentive_id);
  std::vector<uint64_t>                                  GetIncentivesByIssuer(const std::string& issuer);
  std::vector<uint64_t>                                  GetIncentivesByCategory(scavenger::ledger::v1::WasteCategory category);
  std::optional<scavenger::ledger::v1::IncentiveProgram> GetBestActiveIncentiveFor(const std::string& issuer,
                                                                                   scavenger::ledger::v1::WasteCategory category);
  std::vector<scavenger::ledger::v1::IncentiveProgram>   GetActiveIncentivesSorted(scavenger::ledger::v1::WasteCategory category);

  // Settlement and statistics
  scavenger::ledger::v1::SettlementReceipt SettleRewards(uint64_t waste_id, uint64_t incentive_id, const std::string& caller);
  uint64_t                                 GetEarnings(const std::string& participant);
  scavenger::ledger::v1::SupplyChainStats  GetSupplyChainStats();
  std::optional<scavenger::ledger::v1::ParticipantStats> GetParticipantStats(const std::string& participant);

 private:
  WasteRegistry    registry_;
  TransferLedger   transfers_;
  IncentiveStore   incentives_;
  RewardSettlement settlement_;
};

} // namespace scavenger::core
