#include "sqlite_schema.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace scavenger::db::sqlite {

namespace {

using Migration = std::vector<std::string>;

// Index i upgrades a database from version i to i + 1.
const std::vector<Migration>& Migrations() {
  static const std::vector<Migration> kMigrations = {
      {
          "CREATE TABLE counters ("
          "  name  TEXT PRIMARY KEY,"
          "  value INTEGER NOT NULL);",

          "CREATE TABLE waste ("
          "  id            INTEGER PRIMARY KEY,"
          "  category      INTEGER NOT NULL,"
          "  weight_grams  INTEGER NOT NULL,"
          "  submitter     TEXT NOT NULL,"
          "  current_owner TEXT NOT NULL,"
          "  status        INTEGER NOT NULL,"
          "  is_confirmed  INTEGER NOT NULL,"
          "  confirmer     TEXT NOT NULL,"
          "  is_active     INTEGER NOT NULL,"
          "  latitude      INTEGER NOT NULL,"
          "  longitude     INTEGER NOT NULL,"
          "  description   TEXT NOT NULL,"
          "  created_at_ms INTEGER NOT NULL);",

          "CREATE TABLE transfers ("
          "  id               INTEGER PRIMARY KEY,"
          "  waste_id         INTEGER NOT NULL REFERENCES waste(id),"
          "  from_participant TEXT NOT NULL,"
          "  to_participant   TEXT NOT NULL,"
          "  timestamp_ms     INTEGER NOT NULL,"
          "  note             TEXT NOT NULL);",
          "CREATE INDEX transfers_by_waste ON transfers(waste_id, id);",

          "CREATE TABLE participant_wastes ("
          "  seq         INTEGER PRIMARY KEY AUTOINCREMENT,"
          "  participant TEXT NOT NULL,"
          "  waste_id    INTEGER NOT NULL REFERENCES waste(id),"
          "  UNIQUE (participant, waste_id));",

          "CREATE TABLE incentives ("
          "  id               INTEGER PRIMARY KEY,"
          "  issuer           TEXT NOT NULL,"
          "  category         INTEGER NOT NULL,"
          "  reward_rate      INTEGER NOT NULL,"
          "  total_budget     INTEGER NOT NULL,"
          "  remaining_budget INTEGER NOT NULL,"
          "  active           INTEGER NOT NULL,"
          "  created_at_ms    INTEGER NOT NULL,"
          "  CHECK (remaining_budget <= total_budget));",
          "CREATE INDEX incentives_by_issuer ON incentives(issuer, id);",
          "CREATE INDEX incentives_by_category ON incentives(category, id);",

          "CREATE TABLE participant_earnings ("
          "  participant   TEXT PRIMARY KEY,"
          "  total_earned  INTEGER NOT NULL,"
          "  updated_at_ms INTEGER NOT NULL);",
      },
      {
          // Budgets are stored as the int64 bit pattern of a uint64, so a
          // SQL comparison between them is signed. The repository enforces
          // remaining_budget <= total_budget instead.
          "CREATE TABLE incentives_v2 ("
          "  id               INTEGER PRIMARY KEY,"
          "  issuer           TEXT NOT NULL,"
          "  category         INTEGER NOT NULL,"
          "  reward_rate      INTEGER NOT NULL,"
          "  total_budget     INTEGER NOT NULL,"
          "  remaining_budget INTEGER NOT NULL,"
          "  active           INTEGER NOT NULL,"
          "  created_at_ms    INTEGER NOT NULL);",
          "INSERT INTO incentives_v2 "
          "  SELECT id,issuer,category,reward_rate,total_budget,remaining_budget,active,created_at_ms FROM incentives;",
          "DROP TABLE incentives;",
          "ALTER TABLE incentives_v2 RENAME TO incentives;",
          "CREATE INDEX incentives_by_issuer ON incentives(issuer, id);",
          "CREATE INDEX incentives_by_category ON incentives(category, id);",

          "CREATE TABLE participant_activity ("
          "  participant        TEXT PRIMARY KEY,"
          "  total_submissions  INTEGER NOT NULL,"
          "  total_weight_grams INTEGER NOT NULL,"
          "  updated_at_ms      INTEGER NOT NULL);",

          "CREATE TABLE participant_category_submissions ("
          "  participant TEXT NOT NULL,"
          "  category    INTEGER NOT NULL,"
          "  submissions INTEGER NOT NULL,"
          "  PRIMARY KEY (participant, category));",
      },
  };
  return kMigrations;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static_assert(kSchemaVersion >= 1);

  const auto current = db.UserVersion();
  if (current > kSchemaVersion) {
    throw std::runtime_error("sqlite schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (current == kSchemaVersion) {
    return;
  }

  const auto& migrations = Migrations();

  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (auto version = current; version < kSchemaVersion; ++version) {
      for (const auto& sql : migrations.at(static_cast<size_t>(version))) {
        db.Exec(sql);
      }
    }
    db.SetUserVersion(kSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception& ex) {
    SCAVENGER_LOG_ERROR("sqlite migration failed", {observability::IntField("from_version", current), observability::StringField("error", ex.what())});
    db.Exec("ROLLBACK;");
    throw;
  }

  SCAVENGER_LOG_INFO("sqlite schema migrated",
                     {observability::IntField("from_version", current), observability::IntField("to_version", kSchemaVersion)});
}

} // namespace scavenger::db::sqlite
