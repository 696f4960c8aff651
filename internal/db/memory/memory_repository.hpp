#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace scavenger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  std::vector<uint64_t> ListIncentivesByCategory(Transaction&,
                                                 scavenger::ledger::v1::WasteCategory category) override;

  std::optional<model::EarningsRecord> GetEarnings(Transaction&, const std::string& participant) override;
  Result UpsertEarnings(Transaction&, const model::EarningsRecord&) override;

  std::optional<model::ParticipantActivityRecord> GetParticipantActivity(Transaction&, const std::string& participant) override;
  Result UpsertParticipantActivity(Transaction&, const model::ParticipantActivityRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, uint64_t> counters;

    // ordered so ListWastes is by id
    std::map<uint64_t, model::WasteRecord> wastes;
    std::unordered_map<uint64_t, std::vector<model::TransferRecord>> transfers;
    std::unordered_map<std::string, std::vector<uint64_t>> participant_wastes;

    std::unordered_map<uint64_t, model::IncentiveRecord> incentives;
    std::unordered_map<std::string, std::vector<uint64_t>> incentives_by_issuer;
    std::unordered_map<int, std::vector<uint64_t>> incentives_by_category;

    std::unordered_map<std::string, model::EarningsRecord> earnings;
    std::unordered_map<std::string, model::ParticipantActivityRecord> activity;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
