#include "record_access.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;

void ThrowIfDbError(const scavenger::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + scavenger::db::ErrorCodeName(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  switch (result.code) {
    case scavenger::db::ErrorCode::NotFound:
      throw scavenger::util::NotFound(message);
    case scavenger::db::ErrorCode::AlreadyExists:
    case scavenger::db::ErrorCode::ConstraintViolation:
      throw scavenger::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

scavenger::db::model::WasteRecord RequireWaste(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                               const std::string& context) {
  auto record = repository.GetWaste(tx, id);
  if (!record.has_value()) {
    throw scavenger::util::NotFound(context + ": waste " + std::to_string(id) + " not found");
  }
  return *record;
}

scavenger::db::model::WasteRecord RequireActiveWaste(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                                     const std::string& context) {
  auto record = RequireWaste(repository, tx, id, context);
  if (!record.is_active) {
    throw scavenger::util::InvalidState(context + ": waste " + std::to_string(id) + " is deactivated");
  }
  return record;
}

scavenger::db::model::IncentiveRecord RequireIncentive(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                                       const std::string& context) {
  auto record = repository.GetIncentive(tx, id);
  if (!record.has_value()) {
    throw scavenger::util::NotFound(context + ": incentive " + std::to_string(id) + " not found");
  }
  return *record;
}

WasteUnit ToProto(const scavenger::db::model::WasteRecord& record) {
  WasteUnit unit;
  unit.set_id(record.id);
  unit.set_category(record.category);
  unit.set_weight_grams(record.weight_grams);
  unit.set_submitter(record.submitter);
  unit.set_current_owner(record.current_owner);
  unit.set_status(record.status);
  unit.set_is_confirmed(record.is_confirmed);
  unit.set_confirmer(record.confirmer);
  unit.set_is_active(record.is_active);
  auto* location = unit.mutable_location();
  location->set_latitude(record.latitude);
  location->set_longitude(record.longitude);
  location->set_description(record.description);
  unit.set_created_at_ms(record.created_at_ms);
  return unit;
}

TransferRecord ToProto(const scavenger::db::model::TransferRecord& record) {
  TransferRecord transfer;
  transfer.set_id(record.id);
  transfer.set_waste_id(record.waste_id);
  transfer.set_from(record.from);
  transfer.set_to(record.to);
  transfer.set_timestamp_ms(record.timestamp_ms);
  transfer.set_note(record.note);
  return transfer;
}

IncentiveProgram ToProto(const scavenger::db::model::IncentiveRecord& record) {
  IncentiveProgram program;
  program.set_id(record.id);
  program.set_issuer(record.issuer);
  program.set_category(record.category);
  program.set_reward_rate(record.reward_rate);
  program.set_total_budget(record.total_budget);
  program.set_remaining_budget(record.remaining_budget);
  program.set_active(record.active);
  program.set_created_at_ms(record.created_at_ms);
  return program;
}

} // namespace scavenger::core
