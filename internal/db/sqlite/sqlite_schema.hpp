#pragma once

#include <cstdint>

#include "sqlite_db.hpp"

namespace scavenger::db::sqlite {

// Schema version this build reads and writes (PRAGMA user_version).
inline constexpr int64_t kSchemaVersion = 2;

/*
  Brings the ledger schema up to kSchemaVersion.

  Pending migrations run in one transaction together with the version bump.
  Safe to call on every start. Throws std::runtime_error when the database
  was written by a newer schema.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace scavenger::db::sqlite
