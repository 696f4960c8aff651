#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/collaborators.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/core/id_allocator.hpp"
#include "internal/db/model/incentive_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/db/model/waste_record.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

// Lifetime total of settled rewards, kept next to the id counters.
inline constexpr const char* kTokensDistributedCounter = "tokens_distributed";

struct PlannedPayment {
  std::string                        payee;
  scavenger::ledger::v1::PayeeKind   kind   = scavenger::ledger::v1::PAYEE_KIND_UNSPECIFIED;
  uint64_t                           amount = 0;
};

struct SettlementPlan {
  uint64_t                    total_reward = 0;
  std::vector<PlannedPayment> payments;
};

/*
  Pure reward computation for one waste unit against one program.

    total      = reward_rate * floor(weight_grams / 1000)
    collectors = total * collector_percent / 100, once per collector hop
    submitter  = total * owner_percent / 100
    holder     = total - everything above

  Every collector hop gets the full collector share, so a chain with many
  collectors can exceed the total; the holder remainder then underflows and
  the plan fails with util::Overflow. Throws util::InsufficientBudget when
  total exceeds the program's remaining budget.
*/
SettlementPlan PlanSettlement(const scavenger::db::model::WasteRecord& waste, const scavenger::db::model::IncentiveRecord& incentive,
                              const std::vector<scavenger::db::model::TransferRecord>& history, const RewardSplit& split,
                              const std::function<bool(const std::string&)>& is_collector);

/*
  Settles rewards and owns the earnings book.

  The plan is computed, the budget debit, earnings and distributed total
  are staged in the transaction, and the whole payment batch is checked
  with ValueTransfer::Check. Only then do the payments go out (issuer ->
  payee, zero amounts skipped), followed by the commit. A payment that
  fails after a passing check, or a failed commit, can still leave earlier
  payments behind.
*/
class RewardSettlement {
 public:
  explicit RewardSettlement(EngineContext ctx);

  scavenger::ledger::v1::SettlementReceipt Settle(uint64_t waste_id, uint64_t incentive_id, const std::string& caller);

  uint64_t EarningsOf(const std::string& participant);

  // Submission totals joined with earnings; nullopt for a participant that
  // has neither submitted nor earned.
  std::optional<scavenger::ledger::v1::ParticipantStats> ParticipantStatsOf(const std::string& participant);

  scavenger::ledger::v1::SupplyChainStats Stats();

 private:
  EngineContext ctx_;
  IdAllocator   ids_;
};

} // namespace scavenger::core
