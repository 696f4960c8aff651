#include "waste_registry.hpp"

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
using scavenger::observability::IntField;
using scavenger::observability::StringField;
using scavenger::observability::UintField;

WasteRegistry::WasteRegistry(EngineContext ctx) : ctx_(std::move(ctx)), auth_(ctx_.directory), ids_(ctx_.repository) {
}

bool WasteRegistry::IsModifiable(WasteStatus status) {
  return status == WASTE_STATUS_PENDING || status == WASTE_STATUS_PROCESSING;
}

void WasteRegistry::ValidateSubmission(WasteCategory category, uint64_t weight_grams, const std::string& context) {
  if (category == WASTE_CATEGORY_UNSPECIFIED || !WasteCategory_IsValid(category)) {
    throw scavenger::util::InvalidInput(context + ": category is required");
  }
  if (weight_grams == 0) {
    throw scavenger::util::InvalidInput(context + ": weight must be greater than zero");
  }
}

scavenger::db::model::WasteRecord WasteRegistry::InsertSubmission(scavenger::db::Transaction& tx, WasteCategory category, uint64_t weight_grams,
                                                                  const std::string& submitter, const Location& location, uint64_t now,
                                                                  const std::string& context) {
  auto& repository = *ctx_.repository;

  scavenger::db::model::WasteRecord record;
  record.id            = ids_.Next(tx, IdSpace::kWaste);
  record.category      = category;
  record.weight_grams  = weight_grams;
  record.submitter     = submitter;
  record.current_owner = submitter;
  record.status        = WASTE_STATUS_PENDING;
  record.is_confirmed  = false;
  record.confirmer     = submitter;
  record.is_active     = true;
  record.latitude      = location.latitude();
  record.longitude     = location.longitude();
  record.description   = location.description();
  record.created_at_ms = now;

  ThrowIfDbError(repository.InsertWaste(tx, record), context);
  ThrowIfDbError(repository.LinkParticipantWaste(tx, submitter, record.id), context);
  return record;
}

void WasteRegistry::RecordActivity(scavenger::db::Transaction& tx, const std::string& submitter,
                                   const std::vector<scavenger::db::model::WasteRecord>& records, uint64_t now, const std::string& context) {
  auto& repository = *ctx_.repository;
  auto  activity   = repository.GetParticipantActivity(tx, submitter).value_or(scavenger::db::model::ParticipantActivityRecord{});

  activity.participant = submitter;
  for (const auto& record : records) {
    activity.total_submissions  = scavenger::util::CheckedAdd(activity.total_submissions, 1, "participant submissions");
    activity.total_weight_grams = scavenger::util::CheckedAdd(activity.total_weight_grams, record.weight_grams, "participant weight");

    auto& per_category = activity.submissions_by_category[record.category];
    per_category       = scavenger::util::CheckedAdd(per_category, 1, "participant category submissions");
  }
  activity.updated_at_ms = now;

  ThrowIfDbError(repository.UpsertParticipantActivity(tx, activity), context);
}

void WasteRegistry::PublishSubmitted(const scavenger::db::model::WasteRecord& record) {
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"waste.submitted",
                               record.id,
                               {StringField("submitter", record.submitter), StringField("category", WasteCategory_Name(record.category)),
                                UintField("weight_grams", record.weight_grams), IntField("latitude", record.latitude),
                                IntField("longitude", record.longitude)}});
}

WasteUnit WasteRegistry::Submit(WasteCategory category, uint64_t weight_grams, const std::string& submitter, const Location& location) {
  auth_.Require(submitter, Capability::kSubmit, "submit waste");
  ValidateSubmission(category, weight_grams, "submit waste");

  auto       tx     = ctx_.repository->Begin();
  const auto now    = scavenger::util::NowMillis();
  const auto record = InsertSubmission(*tx, category, weight_grams, submitter, location, now, "submit waste");
  RecordActivity(*tx, submitter, {record}, now, "submit waste");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste submitted", {UintField("waste_id", record.id), StringField("submitter", submitter),
                                         StringField("category", WasteCategory_Name(category)), UintField("weight_grams", weight_grams)});
  PublishSubmitted(record);
  return ToProto(record);
}

std::vector<WasteUnit> WasteRegistry::SubmitBatch(const std::vector<WasteSubmission>& items, const std::string& submitter) {
  auth_.Require(submitter, Capability::kSubmit, "submit waste batch");
  if (items.empty()) {
    throw scavenger::util::InvalidInput("submit waste batch: batch is empty");
  }

  uint64_t total_weight = 0;
  for (const auto& item : items) {
    ValidateSubmission(item.category(), item.weight_grams(), "submit waste batch");
    total_weight = scavenger::util::CheckedAdd(total_weight, item.weight_grams(), "batch weight");
  }

  auto       tx  = ctx_.repository->Begin();
  const auto now = scavenger::util::NowMillis();

  std::vector<scavenger::db::model::WasteRecord> records;
  records.reserve(items.size());
  for (const auto& item : items) {
    records.push_back(InsertSubmission(*tx, item.category(), item.weight_grams(), submitter, item.location(), now, "submit waste batch"));
  }
  RecordActivity(*tx, submitter, records, now, "submit waste batch");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste batch submitted", {StringField("submitter", submitter), UintField("units", records.size()),
                                               UintField("first_waste_id", records.front().id), UintField("weight_grams", total_weight)});

  std::vector<WasteUnit> units;
  units.reserve(records.size());
  for (const auto& record : records) {
    PublishSubmitted(record);
    units.push_back(ToProto(record));
  }
  return units;
}

bool WasteRegistry::UpdateStatus(uint64_t id, WasteStatus status) {
  if (status == WASTE_STATUS_UNSPECIFIED || !WasteStatus_IsValid(status)) {
    throw scavenger::util::InvalidInput("update waste status: status is required");
  }

  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, id, "update waste status");

  if (!IsModifiable(record.status)) {
    tx->Rollback();
    return false;
  }

  const auto previous = record.status;
  record.status       = status;
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "update waste status");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste status updated",
                     {UintField("waste_id", id), StringField("from", WasteStatus_Name(previous)), StringField("to", WasteStatus_Name(status))});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"waste.status_updated", id, {StringField("status", WasteStatus_Name(status))}});
  return true;
}

WasteUnit WasteRegistry::Confirm(uint64_t id, const std::string& confirmer) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, id, "confirm waste");

  if (confirmer == record.current_owner) {
    throw scavenger::util::Unauthorized("confirm waste: the current owner cannot confirm their own waste");
  }
  if (record.is_confirmed) {
    throw scavenger::util::InvalidState("confirm waste: waste " + std::to_string(id) + " is already confirmed by '" + record.confirmer + "'");
  }
  auth_.Require(confirmer, Capability::kParticipate, "confirm waste");

  record.is_confirmed = true;
  record.confirmer    = confirmer;
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "confirm waste");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste confirmed", {UintField("waste_id", id), StringField("confirmer", confirmer)});
  scavenger::observability::PublishBestEffort(ctx_.events.get(),
                                              Event{"waste.confirmed", id, {StringField("confirmer", confirmer)}});
  return ToProto(record);
}

WasteUnit WasteRegistry::ResetConfirmation(uint64_t id, const std::string& caller) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, id, "reset waste confirmation");

  if (caller != record.current_owner) {
    throw scavenger::util::Unauthorized("reset waste confirmation: only the current owner can reset confirmation");
  }
  if (!record.is_confirmed) {
    throw scavenger::util::InvalidState("reset waste confirmation: waste " + std::to_string(id) + " is not confirmed");
  }

  record.is_confirmed = false;
  record.confirmer    = record.current_owner;
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "reset waste confirmation");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste confirmation reset", {UintField("waste_id", id), StringField("owner", caller)});
  scavenger::observability::PublishBestEffort(ctx_.events.get(),
                                              Event{"waste.confirmation_reset", id, {StringField("owner", caller)}});
  return ToProto(record);
}

WasteUnit WasteRegistry::Deactivate(uint64_t id, const std::string& caller) {
  auth_.Require(caller, Capability::kAdminister, "deactivate waste");

  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, id, "deactivate waste");

  record.is_active = false;
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "deactivate waste");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste deactivated", {UintField("waste_id", id), StringField("admin", caller)});
  scavenger::observability::PublishBestEffort(ctx_.events.get(),
                                              Event{"waste.deactivated", id, {StringField("admin", caller), BoolField("is_active", false)}});
  return ToProto(record);
}

WasteUnit WasteRegistry::FinalizeWeight(uint64_t id, const std::string& caller, uint64_t weight_grams) {
  if (weight_grams == 0) {
    throw scavenger::util::InvalidInput("finalize waste weight: weight must be greater than zero");
  }

  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, id, "finalize waste weight");

  if (caller != record.current_owner) {
    throw scavenger::util::Unauthorized("finalize waste weight: only the current owner can set the weight");
  }
  if (record.weight_grams != 0) {
    throw scavenger::util::InvalidState("finalize waste weight: waste " + std::to_string(id) + " already has a weight");
  }

  record.weight_grams = weight_grams;
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "finalize waste weight");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste weight finalized", {UintField("waste_id", id), UintField("weight_grams", weight_grams)});
  scavenger::observability::PublishBestEffort(ctx_.events.get(),
                                              Event{"waste.weight_finalized", id, {UintField("weight_grams", weight_grams)}});
  return ToProto(record);
}

std::optional<WasteUnit> WasteRegistry::Get(uint64_t id) {
  auto tx     = ctx_.repository->Begin();
  auto record = ctx_.repository->GetWaste(*tx, id);
  tx->Commit();
  if (!record.has_value()) return std::nullopt;
  return ToProto(*record);
}

bool WasteRegistry::Exists(uint64_t id) {
  return Get(id).has_value();
}

std::vector<std::optional<WasteUnit>> WasteRegistry::GetBatch(const std::vector<uint64_t>& ids) {
  auto tx = ctx_.repository->Begin();

  std::vector<std::optional<WasteUnit>> units;
  units.reserve(ids.size());
  for (const auto id : ids) {
    auto record = ctx_.repository->GetWaste(*tx, id);
    units.push_back(record.has_value() ? std::optional<WasteUnit>(ToProto(*record)) : std::nullopt);
  }

  tx->Commit();
  return units;
}

std::vector<uint64_t> WasteRegistry::ParticipantWastes(const std::string& participant) {
  auto tx  = ctx_.repository->Begin();
  auto ids = ctx_.repository->GetParticipantWastes(*tx, participant);
  tx->Commit();
  return ids;
}

} // namespace scavenger::core
