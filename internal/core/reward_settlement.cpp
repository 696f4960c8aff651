#include "reward_settlement.hpp"

#include <stdexcept>

#include "internal/core/record_access.hpp"
#include "internal/observability/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/checked_math.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;
using scavenger::observability::BoolField;
using scavenger::observability::Event;
using scavenger::observability::StringField;
using scavenger::observability::UintField;

namespace {

constexpr uint64_t kGramsPerKilogram = 1000;

} // namespace

SettlementPlan PlanSettlement(const scavenger::db::model::WasteRecord& waste, const scavenger::db::model::IncentiveRecord& incentive,
                              const std::vector<scavenger::db::model::TransferRecord>& history, const RewardSplit& split,
                              const std::function<bool(const std::string&)>& is_collector) {
  SettlementPlan plan;
  plan.total_reward = scavenger::util::CheckedMul(incentive.reward_rate, waste.weight_grams / kGramsPerKilogram, "total reward");

  if (plan.total_reward > incentive.remaining_budget) {
    throw scavenger::util::InsufficientBudget("settle rewards: reward " + std::to_string(plan.total_reward) + " exceeds remaining budget " +
                                              std::to_string(incentive.remaining_budget) + " of incentive " +
                                              std::to_string(incentive.id));
  }

  uint64_t distributed = 0;

  for (const auto& transfer : history) {
    if (!is_collector(transfer.to)) continue;
    const auto share = scavenger::util::PercentOf(plan.total_reward, split.collector_percent, "collector share");
    distributed      = scavenger::util::CheckedAdd(distributed, share, "distributed reward");
    plan.payments.push_back(PlannedPayment{transfer.to, PAYEE_KIND_COLLECTOR, share});
  }

  const auto owner_share = scavenger::util::PercentOf(plan.total_reward, split.owner_percent, "submitter share");
  distributed            = scavenger::util::CheckedAdd(distributed, owner_share, "distributed reward");
  plan.payments.push_back(PlannedPayment{waste.submitter, PAYEE_KIND_SUBMITTER, owner_share});

  const auto remainder = scavenger::util::CheckedSub(plan.total_reward, distributed, "final holder share");
  plan.payments.push_back(PlannedPayment{waste.current_owner, PAYEE_KIND_FINAL_HOLDER, remainder});

  return plan;
}

RewardSettlement::RewardSettlement(EngineContext ctx) : ctx_(std::move(ctx)), ids_(ctx_.repository) {
  if (!ctx_.payments || !ctx_.split || !ctx_.directory) {
    throw std::invalid_argument("RewardSettlement requires payments, reward split and participant directory");
  }
}

SettlementReceipt RewardSettlement::Settle(uint64_t waste_id, uint64_t incentive_id, const std::string& caller) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();

  const auto waste     = RequireActiveWaste(repository, *tx, waste_id, "settle rewards");
  auto       incentive = RequireIncentive(repository, *tx, incentive_id, "settle rewards");

  if (incentive.issuer != caller) {
    throw scavenger::util::Unauthorized("settle rewards: only the issuer can settle against incentive " + std::to_string(incentive_id));
  }
  if (!incentive.active) {
    throw scavenger::util::InvalidState("settle rewards: incentive " + std::to_string(incentive_id) + " is not active");
  }
  if (incentive.category != waste.category) {
    throw scavenger::util::InvalidState("settle rewards: incentive category " + WasteCategory_Name(incentive.category) +
                                        " does not match waste category " + WasteCategory_Name(waste.category));
  }

  const auto history = repository.GetTransfers(*tx, waste_id);
  const auto split   = ctx_.split->Split();
  const auto plan    = PlanSettlement(waste, incentive, history, split, [this](const std::string& participant) {
    return ctx_.directory->HasCapability(participant, Capability::kCollect);
  });

  size_t collector_hops = 0;
  for (const auto& payment : plan.payments) {
    if (payment.kind == PAYEE_KIND_COLLECTOR) ++collector_hops;
  }
  if (collector_hops > 1) {
    SCAVENGER_LOG_WARN("settlement pays the full collector share to every collector hop",
                       {UintField("waste_id", waste_id), UintField("collector_hops", collector_hops)});
  }

  const auto now = scavenger::util::NowMillis();

  // Stage every store write first so the only steps left after the first
  // payment are the payments themselves and the commit.
  incentive.remaining_budget -= plan.total_reward;
  if (incentive.remaining_budget == 0) {
    incentive.active = false;
  }
  ThrowIfDbError(repository.UpdateIncentive(*tx, incentive), "settle rewards");

  std::vector<PaymentInstruction> batch;
  for (const auto& payment : plan.payments) {
    if (payment.amount == 0) continue;
    auto earnings = repository.GetEarnings(*tx, payment.payee).value_or(scavenger::db::model::EarningsRecord{payment.payee, 0, 0});
    earnings.total_earned  = scavenger::util::CheckedAdd(earnings.total_earned, payment.amount, "participant earnings");
    earnings.updated_at_ms = now;
    ThrowIfDbError(repository.UpsertEarnings(*tx, earnings), "settle rewards");
    batch.push_back(PaymentInstruction{incentive.issuer, payment.payee, payment.amount});
  }

  const auto distributed_total =
      scavenger::util::CheckedAdd(repository.GetCounter(*tx, kTokensDistributedCounter), plan.total_reward, "tokens distributed");
  ThrowIfDbError(repository.SetCounter(*tx, kTokensDistributedCounter, distributed_total), "settle rewards");

  ctx_.payments->Check(batch);
  for (const auto& payment : batch) {
    ctx_.payments->Pay(payment.from, payment.to, payment.amount);
  }

  tx->Commit();

  SettlementReceipt receipt;
  receipt.set_waste_id(waste_id);
  receipt.set_incentive_id(incentive_id);
  receipt.set_total_reward(plan.total_reward);
  for (const auto& planned : plan.payments) {
    auto* payment = receipt.add_payments();
    payment->set_payee(planned.payee);
    payment->set_kind(planned.kind);
    payment->set_amount(planned.amount);
  }
  receipt.set_remaining_budget(incentive.remaining_budget);
  receipt.set_incentive_active(incentive.active);

  SCAVENGER_LOG_INFO("rewards settled", {UintField("waste_id", waste_id), UintField("incentive_id", incentive_id),
                                         UintField("total_reward", plan.total_reward), UintField("remaining_budget", incentive.remaining_budget),
                                         BoolField("incentive_active", incentive.active)});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"rewards.settled",
                               waste_id,
                               {UintField("incentive_id", incentive_id), StringField("issuer", incentive.issuer),
                                UintField("total_reward", plan.total_reward), UintField("remaining_budget", incentive.remaining_budget)}});
  return receipt;
}

uint64_t RewardSettlement::EarningsOf(const std::string& participant) {
  auto tx       = ctx_.repository->Begin();
  auto earnings = ctx_.repository->GetEarnings(*tx, participant);
  tx->Commit();
  return earnings.has_value() ? earnings->total_earned : 0;
}

std::optional<ParticipantStats> RewardSettlement::ParticipantStatsOf(const std::string& participant) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  activity   = repository.GetParticipantActivity(*tx, participant);
  auto  earnings   = repository.GetEarnings(*tx, participant);
  tx->Commit();

  if (!activity.has_value() && !earnings.has_value()) return std::nullopt;

  ParticipantStats stats;
  stats.set_participant(participant);
  if (activity.has_value()) {
    stats.set_total_submissions(activity->total_submissions);
    stats.set_total_weight_grams(activity->total_weight_grams);
    for (const auto& [category, submissions] : activity->submissions_by_category) {
      auto* entry = stats.add_by_category();
      entry->set_category(category);
      entry->set_submissions(submissions);
    }
  }
  if (earnings.has_value()) {
    stats.set_total_earned(earnings->total_earned);
  }
  return stats;
}

SupplyChainStats RewardSettlement::Stats() {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();

  SupplyChainStats stats;
  stats.set_total_wastes(ids_.Current(*tx, IdSpace::kWaste));

  uint64_t active_weight = 0;
  for (const auto& waste : repository.ListWastes(*tx)) {
    if (!waste.is_active) continue;
    active_weight = scavenger::util::CheckedAdd(active_weight, waste.weight_grams, "total active weight");
  }
  stats.set_total_active_weight_grams(active_weight);
  stats.set_total_tokens_distributed(repository.GetCounter(*tx, kTokensDistributedCounter));

  tx->Commit();
  return stats;
}

} // namespace scavenger::core
