#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/incentive_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/db/model/waste_record.hpp"
#include "scavenger/ledger/v1.hpp"

namespace scavenger::core {

// Translates a failed repository result into the engine's error types.
void ThrowIfDbError(const scavenger::db::Result& result, const std::string& context);

// Loads a waste unit or throws util::NotFound.
scavenger::db::model::WasteRecord RequireWaste(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                               const std::string& context);

// As RequireWaste, additionally throwing util::InvalidState for a deactivated unit.
scavenger::db::model::WasteRecord RequireActiveWaste(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                                     const std::string& context);

scavenger::db::model::IncentiveRecord RequireIncentive(scavenger::db::Repository& repository, scavenger::db::Transaction& tx, uint64_t id,
                                                       const std::string& context);

scavenger::ledger::v1::WasteUnit        ToProto(const scavenger::db::model::WasteRecord& record);
scavenger::ledger::v1::TransferRecord   ToProto(const scavenger::db::model::TransferRecord& record);
scavenger::ledger::v1::IncentiveProgram ToProto(const scavenger::db::model::IncentiveRecord& record);

} // namespace scavenger::core
