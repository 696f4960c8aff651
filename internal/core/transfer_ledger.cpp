#include "transfer_ledger.hpp"

#include <algorithm>

#include "internal/core/record_access.hpp"
#include "internal/observability/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scavenger::core {

using namespace scavenger::ledger::v1;
using scavenger::observability::Event;
using scavenger::observability::StringField;
using scavenger::observability::UintField;

TransferLedger::TransferLedger(EngineContext ctx) : ctx_(std::move(ctx)), auth_(ctx_.directory), ids_(ctx_.repository) {
}

bool TransferLedger::CanTransfer(const std::string& from, const std::string& to) const {
  return auth_.CanTransfer(from, to);
}

WasteUnit TransferLedger::Transfer(uint64_t waste_id, const std::string& from, const std::string& to, const std::string& note) {
  auto& repository = *ctx_.repository;
  auto  tx         = repository.Begin();
  auto  record     = RequireActiveWaste(repository, *tx, waste_id, "transfer waste");

  if (from != record.current_owner) {
    throw scavenger::util::Unauthorized("transfer waste: '" + from + "' is not the current owner of waste " + std::to_string(waste_id));
  }
  const auto from_role = auth_.RoleOf(from);
  const auto to_role   = auth_.RoleOf(to);
  if (!Authorizer::IsAllowedTransition(from_role, to_role)) {
    throw scavenger::util::Unauthorized("transfer waste: " + ParticipantRole_Name(from_role) + " -> " + ParticipantRole_Name(to_role) +
                                        " is not an allowed transfer");
  }

  const auto history = repository.GetTransfers(*tx, waste_id);

  scavenger::db::model::TransferRecord transfer;
  transfer.id           = ids_.Next(*tx, IdSpace::kTransfer);
  transfer.waste_id     = waste_id;
  transfer.from         = from;
  transfer.to           = to;
  transfer.timestamp_ms = scavenger::util::NowMillis();
  if (!history.empty()) {
    transfer.timestamp_ms = std::max(transfer.timestamp_ms, history.back().timestamp_ms);
  }
  transfer.note = note;

  record.current_owner = to;

  ThrowIfDbError(repository.AppendTransfer(*tx, transfer), "transfer waste");
  ThrowIfDbError(repository.UpdateWaste(*tx, record), "transfer waste");
  ThrowIfDbError(repository.LinkParticipantWaste(*tx, to, waste_id), "transfer waste");
  tx->Commit();

  SCAVENGER_LOG_INFO("waste transferred", {UintField("waste_id", waste_id), UintField("transfer_id", transfer.id), StringField("from", from),
                                           StringField("to", to)});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(),
      Event{"waste.transferred", waste_id, {StringField("from", from), StringField("to", to), UintField("transfer_id", transfer.id)}});
  return ToProto(record);
}

WasteUnit TransferLedger::TransferBulk(WasteCategory category, const std::string& collector, const std::string& manufacturer,
                                       const Location& location, const std::string& note) {
  if (category == WASTE_CATEGORY_UNSPECIFIED || !WasteCategory_IsValid(category)) {
    throw scavenger::util::InvalidInput("bulk transfer: category is required");
  }
  if (auth_.RoleOf(collector) != PARTICIPANT_ROLE_COLLECTOR) {
    throw scavenger::util::Unauthorized("bulk transfer: '" + collector + "' is not a collector");
  }
  if (auth_.RoleOf(manufacturer) != PARTICIPANT_ROLE_MANUFACTURER) {
    throw scavenger::util::Unauthorized("bulk transfer: '" + manufacturer + "' is not a manufacturer");
  }

  auto&      repository = *ctx_.repository;
  auto       tx         = repository.Begin();
  const auto now        = scavenger::util::NowMillis();

  scavenger::db::model::WasteRecord record;
  record.id            = ids_.Next(*tx, IdSpace::kWaste);
  record.category      = category;
  record.weight_grams  = 0;
  record.submitter     = collector;
  record.current_owner = manufacturer;
  record.status        = WASTE_STATUS_PENDING;
  record.confirmer     = manufacturer;
  record.latitude      = location.latitude();
  record.longitude     = location.longitude();
  record.description   = location.description();
  record.created_at_ms = now;

  scavenger::db::model::TransferRecord transfer;
  transfer.id           = ids_.Next(*tx, IdSpace::kTransfer);
  transfer.waste_id     = record.id;
  transfer.from         = collector;
  transfer.to           = manufacturer;
  transfer.timestamp_ms = now;
  transfer.note         = note;

  ThrowIfDbError(repository.InsertWaste(*tx, record), "bulk transfer");
  ThrowIfDbError(repository.AppendTransfer(*tx, transfer), "bulk transfer");
  ThrowIfDbError(repository.LinkParticipantWaste(*tx, collector, record.id), "bulk transfer");
  ThrowIfDbError(repository.LinkParticipantWaste(*tx, manufacturer, record.id), "bulk transfer");
  tx->Commit();

  SCAVENGER_LOG_INFO("bulk waste transferred", {UintField("waste_id", record.id), StringField("collector", collector),
                                                StringField("manufacturer", manufacturer), StringField("category", WasteCategory_Name(category))});
  scavenger::observability::PublishBestEffort(
      ctx_.events.get(), Event{"waste.bulk_transferred",
                               record.id,
                               {StringField("collector", collector), StringField("manufacturer", manufacturer),
                                StringField("category", WasteCategory_Name(category))}});
  return ToProto(record);
}

std::vector<TransferRecord> TransferLedger::HistoryOf(uint64_t waste_id) {
  auto tx      = ctx_.repository->Begin();
  auto records = ctx_.repository->GetTransfers(*tx, waste_id);
  tx->Commit();

  std::vector<TransferRecord> history;
  history.reserve(records.size());
  for (const auto& record : records) {
    history.push_back(ToProto(record));
  }
  return history;
}

} // namespace scavenger::core
