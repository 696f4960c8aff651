#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/earnings_record.hpp"
#include "internal/db/model/incentive_record.hpp"
#include "internal/db/model/participant_activity_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/db/model/waste_record.hpp"

namespace scavenger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Nothing a transaction wrote survives unless it commits
  - Counters live in the same store as the rows they number

  The engine relies on the last two for all-or-nothing calls and for
  gap-free id allocation.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Counters (id spaces, running totals); absent counters read as 0
  // ---------------------------------------------------------------------

  virtual uint64_t GetCounter(Transaction&, const std::string& name) = 0;

  virtual Result SetCounter(Transaction&, const std::string& name, uint64_t value) = 0;

  // ---------------------------------------------------------------------
  // Waste units
  // ---------------------------------------------------------------------

  virtual Result InsertWaste(Transaction&, const model::WasteRecord&) = 0;

  virtual std::optional<model::WasteRecord> GetWaste(Transaction&, uint64_t id) = 0;

  virtual Result UpdateWaste(Transaction&, const model::WasteRecord&) = 0;

  // Ordered by id.
  virtual std::vector<model::WasteRecord> ListWastes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Transfer history
  // ---------------------------------------------------------------------

  virtual Result AppendTransfer(Transaction&, const model::TransferRecord&) = 0;

  // Insertion order. Empty for unknown waste ids.
  virtual std::vector<model::TransferRecord> GetTransfers(Transaction&, uint64_t waste_id) = 0;

  // ---------------------------------------------------------------------
  // Participant <-> waste association (never removed)
  // ---------------------------------------------------------------------

  // Idempotent: linking an existing pair keeps its original position.
  virtual Result LinkParticipantWaste(Transaction&, const std::string& participant, uint64_t waste_id) = 0;

  virtual std::vector<uint64_t> GetParticipantWastes(Transaction&, const std::string& participant) = 0;

  // ---------------------------------------------------------------------
  // Incentive programs
  // ---------------------------------------------------------------------

  // Insert and update reject remaining_budget > total_budget with
  // ConstraintViolation.
  virtual Result InsertIncentive(Transaction&, const model::IncentiveRecord&) = 0;

  virtual std::optional<model::IncentiveRecord> GetIncentive(Transaction&, uint64_t id) = 0;

  virtual Result UpdateIncentive(Transaction&, const model::IncentiveRecord&) = 0;

  // Creation order.
  virtual std::vector<uint64_t> ListIncentivesByIssuer(Transaction&, const std::string& issuer) = 0;

  // Creation order.
  virtual std::vector<uint64_t> ListIncentivesByCategory(Transaction&, scavenger::ledger::v1::WasteCategory category) = 0;

  // ---------------------------------------------------------------------
  // Earnings
  // ---------------------------------------------------------------------

  virtual std::optional<model::EarningsRecord> GetEarnings(Transaction&, const std::string& participant) = 0;

  virtual Result UpsertEarnings(Transaction&, const model::EarningsRecord&) = 0;

  // ---------------------------------------------------------------------
  // Submission activity
  // ---------------------------------------------------------------------

  virtual std::optional<model::ParticipantActivityRecord> GetParticipantActivity(Transaction&, const std::string& participant) = 0;

  // Replaces the whole record, per-category counts included.
  virtual Result UpsertParticipantActivity(Transaction&, const model::ParticipantActivityRecord&) = 0;
};

} // namespace scavenger::db
