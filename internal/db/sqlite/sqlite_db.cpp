#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace scavenger::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string ErrorText(sqlite3* db, const std::string& what) {
  return what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const auto message = ErrorText(db_, "open " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(message);
  }

  ApplyPragmas(wal_mode);
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  const std::string message = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw std::runtime_error("sqlite exec: " + message);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(ErrorText(db_, "sqlite prepare"));
  }
  return stmt;
}

int64_t SqliteDB::UserVersion() {
  sqlite3_stmt* stmt    = Prepare("PRAGMA user_version;");
  int64_t       version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int64(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::SetUserVersion(int64_t version) {
  // PRAGMA arguments cannot be bound
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  if (wal_mode && path_ != ":memory:") {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA synchronous=FULL;");
  }
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(ErrorText(db_, "sqlite busy_timeout"));
  }

  SCAVENGER_LOG_INFO("sqlite opened", {observability::StringField("path", path_), observability::BoolField("wal", wal_mode)});
}

} // namespace scavenger::db::sqlite
