#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace scavenger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

uint64_t MemoryRepository::GetCounter(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  const auto  it = s.counters.find(name);
  return it == s.counters.end() ? 0 : it->second;
}

Result MemoryRepository::SetCounter(Transaction& t, const std::string& name, uint64_t value) {
  TX(t).Mutable().counters[name] = value;
  return Result::Ok();
}

Result MemoryRepository::InsertWaste(Transaction& t, const model::WasteRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.wastes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "waste " + std::to_string(r.id));
  s.wastes[r.id] = r;
  return Result::Ok();
}

std::optional<model::WasteRecord> MemoryRepository::GetWaste(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.wastes.find(id);
  if (it == s.wastes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateWaste(Transaction& t, const model::WasteRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.wastes.find(r.id);
  if (it == s.wastes.end()) return Result::Err(ErrorCode::NotFound, "waste " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

std::vector<model::WasteRecord> MemoryRepository::ListWastes(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::WasteRecord> records;
  records.reserve(s.wastes.size());
  for (const auto& [_, record] : s.wastes) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::AppendTransfer(Transaction& t, const model::TransferRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.wastes.contains(r.waste_id)) return Result::Err(ErrorCode::NotFound, "waste " + std::to_string(r.waste_id));
  s.transfers[r.waste_id].push_back(r);
  return Result::Ok();
}

std::vector<model::TransferRecord> MemoryRepository::GetTransfers(Transaction& t, uint64_t waste_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.transfers.find(waste_id);
  if (it == s.transfers.end()) return {};
  return it->second;
}

Result MemoryRepository::LinkParticipantWaste(Transaction& t, const std::string& participant, uint64_t waste_id) {
  auto& ids = TX(t).Mutable().participant_wastes[participant];
  if (std::find(ids.begin(), ids.end(), waste_id) == ids.end()) {
    ids.push_back(waste_id);
  }
  return Result::Ok();
}

std::vector<uint64_t> MemoryRepository::GetParticipantWastes(Transaction& t, const std::string& participant) {
  const auto& s  = TX(t).View();
  const auto  it = s.participant_wastes.find(participant);
  if (it == s.participant_wastes.end()) return {};
  return it->second;
}

static Result CheckBudget(const model::IncentiveRecord& r) {
  if (r.remaining_budget > r.total_budget) {
    return Result::Err(ErrorCode::ConstraintViolation, "incentive " + std::to_string(r.id) + " remaining budget exceeds total budget");
  }
  return Result::Ok();
}

Result MemoryRepository::InsertIncentive(Transaction& t, const model::IncentiveRecord& r) {
  if (auto bound = CheckBudget(r); !bound) return bound;
  auto& s = TX(t).Mutable();
  if (s.incentives.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "incentive " + std::to_string(r.id));
  s.incentives[r.id] = r;
  s.incentives_by_issuer[r.issuer].push_back(r.id);
  s.incentives_by_category[static_cast<int>(r.category)].push_back(r.id);
  return Result::Ok();
}

std::optional<model::IncentiveRecord> MemoryRepository::GetIncentive(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.incentives.find(id);
  if (it == s.incentives.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateIncentive(Transaction& t, const model::IncentiveRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.incentives.find(r.id);
  if (it == s.incentives.end()) return Result::Err(ErrorCode::NotFound, "incentive " + std::to_string(r.id));
  // issuer and category are index keys and never change
  if (it->second.issuer != r.issuer || it->second.category != r.category) {
    return Result::Err(ErrorCode::ConstraintViolation, "incentive issuer/category are immutable");
  }
  if (auto bound = CheckBudget(r); !bound) return bound;
  it->second = r;
  return Result::Ok();
}

std::vector<uint64_t> MemoryRepository::ListIncentivesByIssuer(Transaction& t, const std::string& issuer) {
  const auto& s  = TX(t).View();
  const auto  it = s.incentives_by_issuer.find(issuer);
  if (it == s.incentives_by_issuer.end()) return {};
  return it->second;
}

std::vector<uint64_t> MemoryRepository::ListIncentivesByCategory(Transaction& t, scavenger::ledger::v1::WasteCategory category) {
  const auto& s  = TX(t).View();
  const auto  it = s.incentives_by_category.find(static_cast<int>(category));
  if (it == s.incentives_by_category.end()) return {};
  return it->second;
}

std::optional<model::EarningsRecord> MemoryRepository::GetEarnings(Transaction& t, const std::string& participant) {
  const auto& s  = TX(t).View();
  const auto  it = s.earnings.find(participant);
  if (it == s.earnings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertEarnings(Transaction& t, const model::EarningsRecord& r) {
  TX(t).Mutable().earnings[r.participant] = r;
  return Result::Ok();
}

std::optional<model::ParticipantActivityRecord> MemoryRepository::GetParticipantActivity(Transaction& t, const std::string& participant) {
  const auto& s  = TX(t).View();
  const auto  it = s.activity.find(participant);
  if (it == s.activity.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertParticipantActivity(Transaction& t, const model::ParticipantActivityRecord& r) {
  TX(t).Mutable().activity[r.participant] = r;
  return Result::Ok();
}

} // namespace scavenger::db::memory
