#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace scavenger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  uint64_t GetCounter(Transaction&, const std::string& name) override;
  Result SetCounter(Transaction&, const std::string& name, uint64_t value) override;

  Result InsertWaste(Transaction&, const model::WasteRecord&) override;
  std::optional<model::WasteRecord> GetWaste(Transaction&, uint64_t id) override;
  Result UpdateWaste(Transaction&, const model::WasteRecord&) override;
  std::vector<model::WasteRecord> ListWastes(Transaction&) override;

  Result AppendTransfer(Transaction&, const model::TransferRecord&) override;
  std::vector<model::TransferRecord> GetTransfers(Transaction&, uint64_t waste_id) override;

  Result LinkParticipantWaste(Transaction&, const std::string& participant, uint64_t waste_id) override;
  std::vector<uint64_t> GetParticipantWastes(Transaction&, const std::string& participant) override;

  Result InsertIncentive(Transaction&, const model::IncentiveRecord&) override;
  std::optional<model::IncentiveRecord> GetIncentive(Transaction&, uint64_t id) override;
  Result UpdateIncentive(Transaction&, const model::IncentiveRecord&) override;
  std::vector<uint64_t> ListIncentivesByIssuer(Transaction&, const std::string& issuer) override;
  std::vector<uint64_t> ListIncentivesByCategory(Transaction&, scavenger::ledger::v1::WasteCategory category) override;

  std::optional<model::EarningsRecord> GetEarnings(Transaction&, const std::string& participant) override;
  Result UpsertEarnings(Transaction&, const model::EarningsRecord&) override;

  std::optional<model::ParticipantActivityRecord> GetParticipantActivity(Transaction&, const std::string& participant) override;
  Result UpsertParticipantActivity(Transaction&, const model::ParticipantActivityRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
