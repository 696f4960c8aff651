#include "scavenger_ledger.hpp"

#include <chrono>
#include <exception>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;

namespace {

template <typename Fn>
auto ObserveCall(std::string_view operation, Fn&& fn) {
  const auto started = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    SCAVENGER_LOG_DEBUG("ledger call", {scavenger::observability::StringField("operation", operation),
                                        scavenger::observability::IntField("elapsed_us", elapsed.count())});
    return result;
  } catch (const std::exception& ex) {
    SCAVENGER_LOG_WARN("ledger call rejected", {scavenger::observability::StringField("operation", operation),
                                                scavenger::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

ScavengerLedger::ScavengerLedger(EngineContext ctx) : registry_(ctx), transfers_(ctx), incentives_(ctx), settlement_(std::move(ctx)) {
}

WasteUnit ScavengerLedger::SubmitWaste(WasteCategory category, uint64_t weight_grams, const std::string& submitter, const Location& location) {
  return ObserveCall("SubmitWaste", [&] { return registry_.Submit(category, weight_grams, submitter, location); });
}

std::vector<WasteUnit> ScavengerLedger::SubmitWasteBatch(const std::vector<WasteSubmission>& items, const std::string& submitter) {
  return ObserveCall("SubmitWasteBatch", [&] { return registry_.SubmitBatch(items, submitter); });
}

WasteUnit ScavengerLedger::TransferWaste(uint64_t waste_id, const std::string& from, const std::string& to, const std::string& note) {
  return ObserveCall("TransferWaste", [&] { return transfers_.Transfer(waste_id, from, to, note); });
}

WasteUnit ScavengerLedger::TransferBulkWaste(WasteCategory category, const std::string& collector, const std::string& manufacturer,
                                             const Location& location, const std::string& note) {
  return ObserveCall("TransferBulkWaste", [&] { return transfers_.TransferBulk(category, collector, manufacturer, location, note); });
}

WasteUnit ScavengerLedger::FinalizeWasteWeight(uint64_t waste_id, const std::string& caller, uint64_t weight_grams) {
  return ObserveCall("FinalizeWasteWeight", [&] { return registry_.FinalizeWeight(waste_id, caller, weight_grams); });
}

WasteUnit ScavengerLedger::ConfirmWaste(uint64_t waste_id, const std::string& confirmer) {
  return ObserveCall("ConfirmWaste", [&] { return registry_.Confirm(waste_id, confirmer); });
}

WasteUnit ScavengerLedger::ResetWasteConfirmation(uint64_t waste_id, const std::string& caller) {
  return ObserveCall("ResetWasteConfirmation", [&] { return registry_.ResetConfirmation(waste_id, caller); });
}

WasteUnit ScavengerLedger::DeactivateWaste(uint64_t waste_id, const std::string& caller) {
  return ObserveCall("DeactivateWaste", [&] { return registry_.Deactivate(waste_id, caller); });
}

bool ScavengerLedger::UpdateWasteStatus(uint64_t waste_id, WasteStatus status) {
  return ObserveCall("UpdateWasteStatus", [&] { return registry_.UpdateStatus(waste_id, status); });
}

std::optional<WasteUnit> ScavengerLedger::GetWaste(uint64_t waste_id) {
  return ObserveCall("GetWaste", [&] { return registry_.Get(waste_id); });
}

bool ScavengerLedger::WasteExists(uint64_t waste_id) {
  return ObserveCall("WasteExists", [&] { return registry_.Exists(waste_id); });
}

std::vector<std::optional<WasteUnit>> ScavengerLedger::GetWastesBatch(const std::vector<uint64_t>& waste_ids) {
  return ObserveCall("GetWastesBatch", [&] { return registry_.GetBatch(waste_ids); });
}

std::vector<TransferRecord> ScavengerLedger::GetWasteTransferHistory(uint64_t waste_id) {
  return ObserveCall("GetWasteTransferHistory", [&] { return transfers_.HistoryOf(waste_id); });
}

std::vector<uint64_t> ScavengerLedger::GetParticipantWastes(const std::string& participant) {
  return ObserveCall("GetParticipantWastes", [&] { return registry_.ParticipantWastes(participant); });
}

bool ScavengerLedger::CanTransfer(const std::string& from, const std::string& to) {
  return transfers_.CanTransfer(from, to);
}

IncentiveProgram ScavengerLedger::CreateIncentive(const std::string& issuer, WasteCategory category, uint64_t reward_rate, uint64_t total_budget) {
  return ObserveCall("CreateIncentive", [&] { return incentives_.Create(issuer, category, reward_rate, total_budget); });
}

IncentiveProgram ScavengerLedger::UpdateIncentive(uint64_t incentive_id, const std::string& caller, uint64_t reward_rate, uint64_t total_budget) {
  return ObserveCall("UpdateIncentive", [&] { return incentives_.Update(incentive_id, caller, reward_rate, total_budget); });
}

IncentiveProgram ScavengerLedger::SetIncentiveActive(uint64_t incentive_id, const std::string& caller, bool active) {
  return ObserveCall("SetIncentiveActive", [&] { return incentives_.SetActive(incentive_id, caller, active); });
}

std::optional<IncentiveProgram> ScavengerLedger::GetIncentiveById(uint64_t incentive_id) {
  return ObserveCall("GetIncentiveById", [&] { return incentives_.ById(incentive_id); });
}

bool ScavengerLedger::IncentiveExists(uint64_t incentive_id) {
  return ObserveCall("IncentiveExists", [&] { return incentives_.Exists(incentive_id); });
}

std::vector<uint64_t> ScavengerLedger::GetIncentivesByIssuer(const std::string& issuer) {
  return ObserveCall("GetIncentivesByIssuer", [&] { return incentives_.ByIssuer(issuer); });
}

std::vector<uint64_t> ScavengerLedger::GetIncentivesByCategory(WasteCategory category) {
  return ObserveCall("GetIncentivesByCategory", [&] { return incentives_.ByCategory(category); });
}

std::optional<IncentiveProgram> ScavengerLedger::GetBestActiveIncentiveFor(const std::string& issuer, WasteCategory category) {
  return ObserveCall("GetBestActiveIncentiveFor", [&] { return incentives_.BestActiveFor(issuer, category); });
}

std::vector<IncentiveProgram> ScavengerLedger::GetActiveIncentivesSorted(WasteCategory category) {
  return ObserveCall("GetActiveIncentivesSorted", [&] { return incentives_.AllActiveFor(category); });
}

SettlementReceipt ScavengerLedger::SettleRewards(uint64_t waste_id, uint64_t incentive_id, const std::string& caller) {
  return ObserveCall("SettleRewards", [&] { return settlement_.Settle(waste_id, incentive_id, caller); });
}

uint64_t ScavengerLedger::GetEarnings(const std::string& participant) {
  return ObserveCall("GetEarnings", [&] { return settlement_.EarningsOf(participant); });
}

SupplyChainStats ScavengerLedger::GetSupplyChainStats() {
  return ObserveCall("GetSupplyChainStats", [&] { return settlement_.Stats(); });
}

std::optional<ParticipantStats> ScavengerLedger::GetParticipantStats(const std::string& participant) {
  return ObserveCall("GetParticipantStats", [&] { return settlement_.ParticipantStatsOf(participant); });
}

} // namespace scavenger::core
