#include "incentive_store.hpp"

#include <algorithm>

#include "internal/core/record_access.hpp"
#include "internal/observability/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;
using scavenger::observability::BoolField;
using scavenger::observability::Event;
using scavenger::observability::StringField;
using scavenger::observability::UintField;

namespace {

void RequireValidCategory(WasteCategory category, const std::string& context) {
  if (category == WASTE_CATEGORY_UNSPECIFIED || !WasteCategory_IsValid(category)) {
    throw scavenger::util::InvalidInput(context + ": category is required");
  }
}

void RequirePositiveTerms(uint64_t reward_rate, uint64_t total_budget, const std::string& context) {
  if (reward_rate == 0) {
    throw scavenger::util::InvalidInput(context + ": reward rate must be greater than zero");
  }
  if (total_budget == 0) {
    throw scavenger::util::InvalidInput(context + ": total budget must be greater than zero");
  }
}

void RequireIssuer(const scavenger::db::model::IncentiveRecord& record, const std::string& caller, const std::string& context) {
  if (record.issuer != caller) {
    throw scavenger::util::Unauthorized(context + ": only the issuer can modify incentive " + std::to_string(record.id));
  }
}

} // namespace

IncentiveStore::IncentiveStore(EngineContext ctx) : ctx_(std::move(ctx)), auth_(ctx_.directory), ids_(ctx_.repository) {
}

IncentiveProgram IncentiveStore::Create(const std::string& issuer, WasteCategory category, uint64_t reward_rate, uint64_t total_budget) {
  auth_.Require(issuer, Capability::kManufacture, "create incentive");
  RequireValidCategory(category, "create incentive");
  RequirePositiveTerms(reward_rate, total_budget, "create incentive");

  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();

  scavenger::db::model::IncentiveRecord record;
  record.id               = ids_.Next(*tx, IdSpace::kIncentive);
  record.issuer           = issuer;
  record.category         = category;
  record.reward_rate      = reward_rate;
  record.total_budget     = total_budget;
  record.remaining_budget = total_budget;
  record.active           = true;
  record.created_at_ms    = scavenger::util::NowMillis();

  ThrowIfDbError(repository.InsertIncentive(*tx, record), "create incentive");
  tx->Commit();

  SCAVENGER_LOG_INFO("incentive created", {UintField("incentive_id", record.id), StringField("issuer", issuer),
                                           StringField("category", WasteCategory_Name(category)), UintField("reward_rate", reward_rate),
                                           UintField("total_budget", total_budget)});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"incentive.created",
                               record.id,
                               {StringField("issuer", issuer), StringField("category", WasteCategory_Name(category)),
                                UintField("reward_rate", reward_rate), UintField("total_budget", total_budget)}});
  return ToProto(record);
}

IncentiveProgram IncentiveStore::Update(uint64_t id, const std::string& caller, uint64_t reward_rate, uint64_t total_budget) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireIncentive(repository, *tx, id, "update incentive");

  RequireIssuer(record, caller, "update incentive");
  if (!record.active) {
    throw scavenger::util::InvalidState("update incentive: incentive " + std::to_string(id) + " is not active");
  }
  RequirePositiveTerms(reward_rate, total_budget, "update incentive");

  const auto used = record.total_budget - record.remaining_budget;

  record.reward_rate  = reward_rate;
  record.total_budget = total_budget;
  if (total_budget > used) {
    record.remaining_budget = total_budget - used;
  } else {
    record.remaining_budget = 0;
    record.active           = false;
  }

  ThrowIfDbError(repository.UpdateIncentive(*tx, record), "update incentive");
  tx->Commit();

  SCAVENGER_LOG_INFO("incentive updated", {UintField("incentive_id", id), UintField("reward_rate", reward_rate), UintField("total_budget", total_budget),
                                           UintField("remaining_budget", record.remaining_budget), BoolField("active", record.active)});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"incentive.updated",
                               id,
                               {UintField("reward_rate", reward_rate), UintField("total_budget", total_budget),
                                UintField("remaining_budget", record.remaining_budget), BoolField("active", record.active)}});
  return ToProto(record);
}

IncentiveProgram IncentiveStore::SetActive(uint64_t id, const std::string& caller, bool active) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireIncentive(repository, *tx, id, "set incentive active");

  RequireIssuer(record, caller, "set incentive active");
  if (active && record.remaining_budget == 0) {
    throw scavenger::util::InsufficientBudget("set incentive active: incentive " + std::to_string(id) + " has no remaining budget");
  }

  record.active = active;
  ThrowIfDbError(repository.UpdateIncentive(*tx, record), "set incentive active");
  tx->Commit();

  SCAVENGER_LOG_INFO("incentive activation changed", {UintField("incentive_id", id), BoolField("active", active)});
  scavenger::observability::PublishBestEffort(ctx_.events.get(),
                                              Event{"incentive.activation_changed", id, {BoolField("active", active)}});
  return ToProto(record);
}

std::optional<IncentiveProgram> IncentiveStore::ById(uint64_t id) {
  auto tx     = ctx_.repository->Begin();
  auto record = ctx_.repository->GetIncentive(*tx, id);
  tx->Commit();
  if (!record.has_value()) return std::nullopt;
  return ToProto(*record);
}

bool IncentiveStore::Exists(uint64_t id) {
  return ById(id).has_value();
}

std::vector<uint64_t> IncentiveStore::ByIssuer(const std::string& issuer) {
  auto tx  = ctx_.repository->Begin();
  auto ids = ctx_.repository->ListIncentivesByIssuer(*tx, issuer);
  tx->Commit();
  return ids;
}

std::vector<uint64_t> IncentiveStore::ByCategory(WasteCategory category) {
  auto tx  = ctx_.repository->Begin();
  auto ids = ctx_.repository->ListIncentivesByCategory(*tx, category);
  tx->Commit();
  return ids;
}

std::optional<IncentiveProgram> IncentiveStore::BestActiveFor(const std::string& issuer, WasteCategory category) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();

  std::optional<scavenger::db::model::IncentiveRecord> best;
  for (const auto id : repository.ListIncentivesByIssuer(*tx, issuer)) {
    auto record = repository.GetIncentive(*tx, id);
    if (!record.has_value() || !record->active || record->category != category) continue;
    // strict comparison keeps the earliest program on a tie
    if (!best.has_value() || record->reward_rate > best->reward_rate) {
      best = std::move(record);
    }
  }
  tx->Commit();

  if (!best.has_value()) return std::nullopt;
  return ToProto(*best);
}

std::vector<IncentiveProgram> IncentiveStore::AllActiveFor(WasteCategory category) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();

  std::vector<scavenger::db::model::IncentiveRecord> active;
  for (const auto id : repository.ListIncentivesByCategory(*tx, category)) {
    auto record = repository.GetIncentive(*tx, id);
    if (record.has_value() && record->active) {
      active.push_back(std::move(*record));
    }
  }
  tx->Commit();

  std::stable_sort(active.begin(), active.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.reward_rate > rhs.reward_rate; });

  std::vector<IncentiveProgram> programs;
  programs.reserve(active.size());
  for (const auto& record : active) {
    programs.push_back(ToProto(record));
  }
  return programs;
}

} // namespace scavenger::core
